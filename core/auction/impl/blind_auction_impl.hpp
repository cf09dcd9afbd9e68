/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "auction/blind_auction.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <variant>

#include <boost/signals2/signal.hpp>

#include "auction/impl/reveal_processor.hpp"
#include "clock/clock.hpp"
#include "escrow/escrow.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace blindbid::auction {

  class BlindAuctionImpl final : public BlindAuction {
   public:
    /**
     * @return AuctionError::INVALID_DEADLINES unless bidding ends strictly
     * before reveal ends
     */
    static outcome::result<std::shared_ptr<BlindAuctionImpl>> create(
        AuctionConfig config,
        std::shared_ptr<clock::SystemClock> clock,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<escrow::Escrow> escrow);

    BlindAuctionImpl(const BlindAuctionImpl &) = delete;
    BlindAuctionImpl &operator=(const BlindAuctionImpl &) = delete;

    ~BlindAuctionImpl() override = default;

    outcome::result<size_t> bid(const AccountId &who,
                                const Hash256 &commitment,
                                Balance deposit) override;

    outcome::result<RevealReceipt> reveal(
        const AccountId &who,
        const std::vector<Balance> &values,
        const std::vector<bool> &fakes,
        const std::vector<Hash256> &secrets) override;

    outcome::result<Balance> withdraw(const AccountId &who) override;

    outcome::result<Settlement> end() override;

    AuctionState state() const override;

    Phase phase() const override;

    std::vector<Bid> bidsOf(const AccountId &who) const override;

    Balance pendingReturn(const AccountId &who) const override;

    Accounts accounts() const override;

    boost::signals2::connection onHighestBidIncreased(
        HighestBidIncreasedHandler handler) override;

    boost::signals2::connection onAuctionEnded(
        AuctionEndedHandler handler) override;

   private:
    using Event = std::variant<RevealProcessor::HighestBidIncreased, Settlement>;

    BlindAuctionImpl(AuctionConfig config,
                     std::shared_ptr<clock::SystemClock> clock,
                     std::shared_ptr<crypto::Hasher> hasher,
                     std::shared_ptr<escrow::Escrow> escrow);

    /// current time, never earlier than a time already observed
    TimePoint observe(Ledger &ledger) const;

    Phase phaseAt(Ledger &ledger) const;

    /// queues an event, called with the ledger locked
    void postEvent(Event event);

    /**
     * Emits queued events in the order they were posted. Only one thread
     * emits at a time, others return leaving their events to it.
     */
    void drainEvents();

    void emit(const Event &event);

    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<escrow::Escrow> escrow_;
    RevealProcessor reveal_processor_;

    SafeObject<Ledger> ledger_;

    std::mutex events_mutex_;
    std::deque<Event> events_;
    bool draining_events_ = false;

    boost::signals2::signal<void(const AccountId &, Balance)>
        highest_bid_increased_;
    boost::signals2::signal<void(const std::optional<AccountId> &, Balance)>
        auction_ended_;

    log::Logger logger_;
  };

}  // namespace blindbid::auction
