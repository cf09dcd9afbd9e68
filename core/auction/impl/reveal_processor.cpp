/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/impl/reveal_processor.hpp"

#include <boost/assert.hpp>

#include "auction/auction_error.hpp"
#include "auction/commitment.hpp"

namespace blindbid::auction {

  RevealProcessor::RevealProcessor(std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)},
        logger_{log::createLogger("RevealProcessor", "auction")} {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<RevealProcessor::Result> RevealProcessor::process(
      Ledger &ledger,
      const AccountId &who,
      const std::vector<Balance> &values,
      const std::vector<bool> &fakes,
      const std::vector<Hash256> &secrets) const {
    const auto count = ledger.commitments.count(who);
    if (values.size() != count or fakes.size() != count
        or secrets.size() != count) {
      SL_DEBUG(logger_,
               "Reveal of {} rejected: {} bids recorded, got {}/{}/{} values",
               who,
               count,
               values.size(),
               fakes.size(),
               secrets.size());
      return AuctionError::LENGTH_MISMATCH;
    }

    // computed up front, a failure here leaves the ledger untouched
    std::vector<Hash256> digests;
    digests.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      OUTCOME_TRY(digest,
                  makeCommitment(*hasher_, values[i], fakes[i], secrets[i]));
      digests.emplace_back(digest);
    }

    Result result;
    outcome::result<void> status = outcome::success();
    ledger.commitments.visit(who, [&](size_t i, Bid &bid) {
      if (status.has_error()) {
        return;
      }
      if (bid.consumed()) {
        SL_TRACE(logger_, "Bid #{} of {} is already revealed", i, who);
        ++result.receipt.already_revealed;
        return;
      }
      if (bid.commitment != digests[i]) {
        SL_TRACE(logger_, "Bid #{} of {} is forfeited", i, who);
        ++result.receipt.forfeited;
        return;
      }

      ++result.receipt.verified;
      ledger.unclaimed -= bid.deposit;
      // the sum of verified deposits is bounded by the total of deposits
      result.refund += bid.deposit;

      if (not fakes[i] and bid.deposit >= values[i]) {
        auto accepted = placeBid(ledger, who, values[i]);
        if (accepted.has_error()) {
          status = accepted.as_failure();
          return;
        }
        if (accepted.value()) {
          result.refund -= values[i];
          result.events.push_back({who, values[i]});
          ++result.receipt.accepted;
        }
      }

      bid.commitment = Hash256{};
    });
    OUTCOME_TRY(status);

    SL_DEBUG(logger_,
             "Reveal of {}: {} verified, {} forfeited, {} already revealed, "
             "refund {}",
             who,
             result.receipt.verified,
             result.receipt.forfeited,
             result.receipt.already_revealed,
             result.refund);
    return result;
  }

  outcome::result<bool> RevealProcessor::placeBid(Ledger &ledger,
                                                  const AccountId &bidder,
                                                  Balance value) {
    auto &state = ledger.state;
    if (value <= state.highest_bid) {
      return false;
    }
    if (state.highest_bidder.has_value()) {
      OUTCOME_TRY(ledger.withdrawals.credit(state.highest_bidder.value(),
                                            state.highest_bid));
    }
    state.highest_bidder = bidder;
    state.highest_bid = value;
    return true;
  }

}  // namespace blindbid::auction
