/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <vector>

#include <boost/signals2/connection.hpp>

#include "auction/auction_state.hpp"
#include "auction/phase.hpp"
#include "outcome/outcome.hpp"

namespace blindbid::auction {

  /**
   * Sealed-bid auction settled by commit-reveal.
   *
   * Bidders commit to sha2_256-hidden bids backed by deposits while bidding
   * is open, reveal them once bidding closes, and the highest revealed bid
   * is paid to the beneficiary when the reveal window is over. All mutating
   * calls are executed one at a time.
   */
  class BlindAuction {
   public:
    using HighestBidIncreasedHandler =
        std::function<void(const AccountId &bidder, Balance amount)>;
    using AuctionEndedHandler = std::function<void(
        const std::optional<AccountId> &winner, Balance amount)>;

    virtual ~BlindAuction() = default;

    /**
     * Records a commitment and takes its deposit into custody, whether or
     * not the bid is ever revealed.
     * @return position of the bid among the bids of the principal, or
     * AuctionError::TRANSFER_FAILURE if the deposit could not be collected
     */
    virtual outcome::result<size_t> bid(const AccountId &who,
                                        const Hash256 &commitment,
                                        Balance deposit) = 0;

    /**
     * Reveals all bids of a principal. Inputs go in the order the bids were
     * committed. Bids which do not match their commitment are forfeited,
     * the deposits of the others are refunded except for the amount kept as
     * the highest bid.
     */
    virtual outcome::result<RevealReceipt> reveal(
        const AccountId &who,
        const std::vector<Balance> &values,
        const std::vector<bool> &fakes,
        const std::vector<Hash256> &secrets) = 0;

    /**
     * Pays out what the principal is owed for being outbid
     * @return amount paid
     */
    virtual outcome::result<Balance> withdraw(const AccountId &who) = 0;

    /**
     * Ends the auction and pays the highest bid to the beneficiary.
     * Succeeds once.
     */
    virtual outcome::result<Settlement> end() = 0;

    virtual AuctionState state() const = 0;

    virtual Phase phase() const = 0;

    virtual std::vector<Bid> bidsOf(const AccountId &who) const = 0;

    virtual Balance pendingReturn(const AccountId &who) const = 0;

    virtual Accounts accounts() const = 0;

    /// Handlers are called outside of the auction lock, in the order the
    /// auction accepted the events
    virtual boost::signals2::connection onHighestBidIncreased(
        HighestBidIncreasedHandler handler) = 0;

    virtual boost::signals2::connection onAuctionEnded(
        AuctionEndedHandler handler) = 0;
  };

}  // namespace blindbid::auction
