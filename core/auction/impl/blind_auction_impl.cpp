/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/impl/blind_auction_impl.hpp"

#include <algorithm>

#include <boost/assert.hpp>
#include <libp2p/common/final_action.hpp>

#include "auction/auction_error.hpp"
#include "primitives/arithmetic_error.hpp"
#include "primitives/math.hpp"

namespace blindbid::auction {

  outcome::result<std::shared_ptr<BlindAuctionImpl>> BlindAuctionImpl::create(
      AuctionConfig config,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<escrow::Escrow> escrow) {
    if (config.bidding_end >= config.reveal_end) {
      return AuctionError::INVALID_DEADLINES;
    }
    return std::shared_ptr<BlindAuctionImpl>(
        new BlindAuctionImpl(std::move(config),
                             std::move(clock),
                             std::move(hasher),
                             std::move(escrow)));
  }

  BlindAuctionImpl::BlindAuctionImpl(AuctionConfig config,
                                     std::shared_ptr<clock::SystemClock> clock,
                                     std::shared_ptr<crypto::Hasher> hasher,
                                     std::shared_ptr<escrow::Escrow> escrow)
      : clock_{std::move(clock)},
        escrow_{std::move(escrow)},
        reveal_processor_{std::move(hasher)},
        ledger_{std::move(config)},
        logger_{log::createLogger("BlindAuction", "auction")} {
    BOOST_ASSERT(clock_ != nullptr);
    BOOST_ASSERT(escrow_ != nullptr);
    SL_INFO(logger_,
            "Auction for beneficiary {} created",
            ledger_.unsafeGet().state.config.beneficiary);
  }

  TimePoint BlindAuctionImpl::observe(Ledger &ledger) const {
    ledger.last_seen = std::max(ledger.last_seen, clock_->now());
    return ledger.last_seen;
  }

  Phase BlindAuctionImpl::phaseAt(Ledger &ledger) const {
    return derivePhase(
        ledger.state.config, observe(ledger), ledger.state.ended);
  }

  outcome::result<size_t> BlindAuctionImpl::bid(const AccountId &who,
                                                const Hash256 &commitment,
                                                Balance deposit) {
    return ledger_.exclusiveAccess(
        [&](Ledger &ledger) -> outcome::result<size_t> {
          if (auto phase = phaseAt(ledger); phase != Phase::Bidding) {
            SL_DEBUG(logger_, "Bid of {} rejected in {} phase", who, phase);
            return AuctionError::PHASE_VIOLATION;
          }
          if (commitment.isZero()) {
            return AuctionError::EMPTY_COMMITMENT;
          }

          auto total = ledger.total_deposits;
          OUTCOME_TRY(math::checked_add(
              total, deposit, primitives::ArithmeticError::Overflow));

          if (auto res = escrow_->collect(who, deposit); res.has_error()) {
            SL_DEBUG(logger_,
                     "Deposit {} of {} not collected: {}",
                     deposit,
                     who,
                     res.error().message());
            return AuctionError::TRANSFER_FAILURE;
          }

          auto position = ledger.commitments.record(who, commitment, deposit);
          ledger.total_deposits = total;
          ledger.unclaimed += deposit;

          SL_DEBUG(logger_,
                   "Bid #{} of {} recorded with deposit {}",
                   position,
                   who,
                   deposit);
          return position;
        });
  }

  outcome::result<RevealReceipt> BlindAuctionImpl::reveal(
      const AccountId &who,
      const std::vector<Balance> &values,
      const std::vector<bool> &fakes,
      const std::vector<Hash256> &secrets) {
    auto result = ledger_.exclusiveAccess(
        [&](Ledger &ledger) -> outcome::result<RevealReceipt> {
          if (auto phase = phaseAt(ledger); phase != Phase::Reveal) {
            SL_DEBUG(
                logger_, "Reveal of {} rejected in {} phase", who, phase);
            return AuctionError::PHASE_VIOLATION;
          }

          OUTCOME_TRY(processed,
                      reveal_processor_.process(
                          ledger, who, values, fakes, secrets));
          for (auto &event : processed.events) {
            postEvent(std::move(event));
          }

          auto receipt = processed.receipt;
          if (processed.refund != 0) {
            auto res = escrow_->transfer(who, processed.refund);
            if (res.has_value()) {
              ledger.total_paid_out += processed.refund;
              receipt.refunded = processed.refund;
            } else {
              // the refund stays claimable through withdraw
              SL_WARN(logger_,
                      "Refund of {} to {} failed: {}. Queued for withdrawal",
                      processed.refund,
                      who,
                      res.error().message());
              OUTCOME_TRY(ledger.withdrawals.credit(who, processed.refund));
              receipt.deferred = processed.refund;
            }
          }

          return receipt;
        });
    drainEvents();
    return result;
  }

  outcome::result<Balance> BlindAuctionImpl::withdraw(const AccountId &who) {
    return ledger_.exclusiveAccess(
        [&](Ledger &ledger) -> outcome::result<Balance> {
          observe(ledger);

          auto amount = ledger.withdrawals.take(who);
          if (amount == 0) {
            return Balance{0};
          }

          if (auto res = escrow_->transfer(who, amount); res.has_error()) {
            SL_WARN(logger_,
                    "Withdrawal of {} by {} failed: {}",
                    amount,
                    who,
                    res.error().message());
            OUTCOME_TRY(ledger.withdrawals.credit(who, amount));
            return AuctionError::TRANSFER_FAILURE;
          }

          ledger.total_paid_out += amount;
          SL_DEBUG(logger_, "{} withdrew {}", who, amount);
          return amount;
        });
  }

  outcome::result<Settlement> BlindAuctionImpl::end() {
    auto result = ledger_.exclusiveAccess(
        [&](Ledger &ledger) -> outcome::result<Settlement> {
          auto phase = phaseAt(ledger);
          if (phase == Phase::Ended) {
            return AuctionError::ALREADY_ENDED;
          }
          if (phase != Phase::Settleable) {
            SL_DEBUG(logger_, "End rejected in {} phase", phase);
            return AuctionError::PHASE_VIOLATION;
          }

          auto &state = ledger.state;
          state.ended = true;
          Settlement settlement{state.highest_bidder, state.highest_bid};

          if (settlement.amount != 0) {
            auto res =
                escrow_->transfer(state.config.beneficiary, settlement.amount);
            if (res.has_error()) {
              // not ended until the beneficiary is paid, so end() may be
              // retried
              state.ended = false;
              SL_WARN(logger_,
                      "Payment of {} to beneficiary {} failed: {}",
                      settlement.amount,
                      state.config.beneficiary,
                      res.error().message());
              return AuctionError::TRANSFER_FAILURE;
            }
            ledger.total_paid_out += settlement.amount;
          }
          postEvent(settlement);
          return settlement;
        });
    drainEvents();
    return result;
  }

  void BlindAuctionImpl::postEvent(Event event) {
    std::unique_lock lock{events_mutex_};
    events_.emplace_back(std::move(event));
  }

  void BlindAuctionImpl::drainEvents() {
    std::unique_lock lock{events_mutex_};
    if (draining_events_) {
      return;
    }
    draining_events_ = true;
    ::libp2p::common::FinalAction release([&] {
      if (not lock.owns_lock()) {
        lock.lock();
      }
      draining_events_ = false;
    });
    while (not events_.empty()) {
      auto event = std::move(events_.front());
      events_.pop_front();
      lock.unlock();
      emit(event);
      lock.lock();
    }
  }

  void BlindAuctionImpl::emit(const Event &event) {
    if (auto increased =
            std::get_if<RevealProcessor::HighestBidIncreased>(&event)) {
      SL_INFO(logger_,
              "Highest bid increased to {} by {}",
              increased->amount,
              increased->bidder);
      highest_bid_increased_(increased->bidder, increased->amount);
    } else if (auto settlement = std::get_if<Settlement>(&event)) {
      if (settlement->winner.has_value()) {
        SL_INFO(logger_,
                "Auction ended, {} won with {}",
                settlement->winner.value(),
                settlement->amount);
      } else {
        SL_INFO(logger_, "Auction ended without bids");
      }
      auction_ended_(settlement->winner, settlement->amount);
    }
  }

  AuctionState BlindAuctionImpl::state() const {
    return ledger_.sharedAccess(
        [](const Ledger &ledger) { return ledger.state; });
  }

  Phase BlindAuctionImpl::phase() const {
    return ledger_.sharedAccess([&](const Ledger &ledger) {
      return derivePhase(ledger.state.config,
                         std::max(ledger.last_seen, clock_->now()),
                         ledger.state.ended);
    });
  }

  std::vector<Bid> BlindAuctionImpl::bidsOf(const AccountId &who) const {
    return ledger_.sharedAccess(
        [&](const Ledger &ledger) { return ledger.commitments.bidsOf(who); });
  }

  Balance BlindAuctionImpl::pendingReturn(const AccountId &who) const {
    return ledger_.sharedAccess(
        [&](const Ledger &ledger) { return ledger.withdrawals.owed(who); });
  }

  Accounts BlindAuctionImpl::accounts() const {
    return ledger_.sharedAccess(
        [](const Ledger &ledger) { return ledger.accounts(); });
  }

  boost::signals2::connection BlindAuctionImpl::onHighestBidIncreased(
      HighestBidIncreasedHandler handler) {
    return highest_bid_increased_.connect(std::move(handler));
  }

  boost::signals2::connection BlindAuctionImpl::onAuctionEnded(
      AuctionEndedHandler handler) {
    return auction_ended_.connect(std::move(handler));
  }

}  // namespace blindbid::auction
