/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "auction/auction_state.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace blindbid::auction {

  /**
   * Verifies revealed bids against their commitments and updates the
   * highest bid. Does not move funds: the refund it computes is delivered by
   * the caller.
   */
  class RevealProcessor {
   public:
    struct HighestBidIncreased {
      AccountId bidder;
      Balance amount;
    };

    struct Result {
      RevealReceipt receipt;
      /// amount to hand back to the revealing principal
      Balance refund = 0;
      std::vector<HighestBidIncreased> events;
    };

    explicit RevealProcessor(std::shared_ptr<crypto::Hasher> hasher);

    /**
     * Processes every bid of the principal. Phase checks are the caller's
     * responsibility.
     * @return AuctionError::LENGTH_MISMATCH if any of the inputs has a length
     * other than the number of recorded bids
     */
    outcome::result<Result> process(Ledger &ledger,
                                    const AccountId &who,
                                    const std::vector<Balance> &values,
                                    const std::vector<bool> &fakes,
                                    const std::vector<Hash256> &secrets) const;

    /**
     * Makes value the highest bid if it is strictly greater than the current
     * one. The outbid principal is credited its bid in the withdrawal ledger.
     * @return true if the bid was accepted
     */
    static outcome::result<bool> placeBid(Ledger &ledger,
                                          const AccountId &bidder,
                                          Balance value);

   private:
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;
  };

}  // namespace blindbid::auction
