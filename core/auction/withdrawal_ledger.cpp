/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/withdrawal_ledger.hpp"

#include "primitives/arithmetic_error.hpp"
#include "primitives/math.hpp"

namespace blindbid::auction {

  outcome::result<void> WithdrawalLedger::credit(const AccountId &who,
                                                 Balance amount) {
    if (amount == 0) {
      return outcome::success();
    }
    auto total = outstanding_;
    OUTCOME_TRY(math::checked_add(
        total, amount, primitives::ArithmeticError::Overflow));
    // entry never exceeds the total, so it cannot overflow either
    owed_[who] += amount;
    outstanding_ = total;
    return outcome::success();
  }

  Balance WithdrawalLedger::take(const AccountId &who) {
    auto it = owed_.find(who);
    if (it == owed_.end()) {
      return 0;
    }
    auto amount = it->second;
    owed_.erase(it);
    outstanding_ -= amount;
    return amount;
  }

  Balance WithdrawalLedger::owed(const AccountId &who) const {
    auto it = owed_.find(who);
    return it == owed_.end() ? 0 : it->second;
  }

}  // namespace blindbid::auction
