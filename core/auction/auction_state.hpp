/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "auction/commitment_store.hpp"
#include "auction/types.hpp"
#include "auction/withdrawal_ledger.hpp"

namespace blindbid::auction {

  /**
   * Authoritative record of an auction. highest_bid never decreases and
   * ended never returns to false once settlement has been paid.
   */
  struct AuctionState {
    AuctionConfig config;
    bool ended = false;
    std::optional<AccountId> highest_bidder;
    Balance highest_bid = 0;
  };

  /**
   * Everything an auction mutates, kept together so that one lock guards
   * all of it
   */
  struct Ledger {
    explicit Ledger(AuctionConfig config) : state{std::move(config)} {}

    AuctionState state;
    CommitmentStore commitments;
    WithdrawalLedger withdrawals;

    Balance total_deposits = 0;
    Balance total_paid_out = 0;
    Balance unclaimed = 0;

    /// latest time observed, readings of the clock below it are ignored
    TimePoint last_seen{};

    Accounts accounts() const {
      return Accounts{
          .total_deposits = total_deposits,
          .total_paid_out = total_paid_out,
          .outstanding = withdrawals.outstanding(),
          .held_for_beneficiary = state.ended ? 0 : state.highest_bid,
          .unclaimed = unclaimed,
      };
    }
  };

}  // namespace blindbid::auction
