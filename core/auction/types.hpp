/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "clock/clock.hpp"
#include "common/blob.hpp"
#include "primitives/account.hpp"

namespace blindbid::auction {

  using primitives::AccountId;
  using primitives::Balance;
  using TimePoint = clock::SystemClock::TimePoint;

  /**
   * Committed bid. The commitment is cleared to zero once the bid has been
   * through reveal processing.
   */
  struct Bid {
    Hash256 commitment;
    Balance deposit = 0;

    bool consumed() const {
      return commitment.isZero();
    }

    bool operator==(const Bid &other) const = default;
  };

  struct AuctionConfig {
    AccountId beneficiary;
    TimePoint bidding_end;
    TimePoint reveal_end;
  };

  /// Outcome of a single reveal call
  struct RevealReceipt {
    /// bids whose triple matched the commitment
    size_t verified = 0;
    /// bids skipped because the triple did not match
    size_t forfeited = 0;
    /// bids skipped because an earlier reveal already processed them
    size_t already_revealed = 0;
    /// bids that became the highest one during this call
    size_t accepted = 0;
    /// amount delivered to the bidder
    Balance refunded = 0;
    /// amount owed but queued for withdrawal because delivery failed
    Balance deferred = 0;
  };

  struct Settlement {
    std::optional<AccountId> winner;
    Balance amount = 0;
  };

  /**
   * Where the deposited funds currently are.
   * total_deposits == total_paid_out + outstanding + held_for_beneficiary +
   * unclaimed holds after every completed operation.
   */
  struct Accounts {
    Balance total_deposits = 0;
    Balance total_paid_out = 0;
    /// sum of withdrawal ledger entries
    Balance outstanding = 0;
    /// highest bid while it is not paid to the beneficiary
    Balance held_for_beneficiary = 0;
    /// deposits of bids not verified by a reveal yet
    Balance unclaimed = 0;

    bool balanced() const {
      return total_deposits
          == total_paid_out + outstanding + held_for_beneficiary + unclaimed;
    }
  };

}  // namespace blindbid::auction
