/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/impl/in_memory_escrow.hpp"

#include "escrow/escrow_error.hpp"
#include "primitives/math.hpp"

namespace blindbid::escrow {

  InMemoryEscrow::InMemoryEscrow()
      : logger_{log::createLogger("InMemoryEscrow", "escrow")} {}

  outcome::result<void> InMemoryEscrow::transfer(
      const primitives::AccountId &to, primitives::Balance amount) {
    if (frozen_.contains(to)) {
      SL_WARN(logger_, "Transfer of {} to frozen account {} refused", amount, to);
      return EscrowError::DESTINATION_FROZEN;
    }
    if (amount > held_) {
      SL_WARN(logger_,
              "Transfer of {} to {} exceeds custody of {}",
              amount,
              to,
              held_);
      return EscrowError::INSUFFICIENT_FUNDS;
    }
    auto balance = balanceOf(to);
    OUTCOME_TRY(
        math::checked_add(balance, amount, EscrowError::BALANCE_OVERFLOW));
    balances_[to] = balance;
    held_ -= amount;
    SL_DEBUG(logger_, "Transferred {} to {}", amount, to);
    return outcome::success();
  }

  outcome::result<void> InMemoryEscrow::fund(const primitives::AccountId &who,
                                             primitives::Balance amount) {
    auto balance = balanceOf(who);
    OUTCOME_TRY(
        math::checked_add(balance, amount, EscrowError::BALANCE_OVERFLOW));
    balances_[who] = balance;
    return outcome::success();
  }

  outcome::result<void> InMemoryEscrow::collect(
      const primitives::AccountId &from, primitives::Balance amount) {
    auto balance = balanceOf(from);
    OUTCOME_TRY(
        math::checked_sub(balance, amount, EscrowError::INSUFFICIENT_FUNDS));
    auto held = held_;
    OUTCOME_TRY(math::checked_add(held, amount, EscrowError::BALANCE_OVERFLOW));
    balances_[from] = balance;
    held_ = held;
    SL_DEBUG(logger_, "Collected {} from {}", amount, from);
    return outcome::success();
  }

  void InMemoryEscrow::freeze(const primitives::AccountId &who) {
    frozen_.insert(who);
  }

  void InMemoryEscrow::unfreeze(const primitives::AccountId &who) {
    frozen_.erase(who);
  }

  primitives::Balance InMemoryEscrow::balanceOf(
      const primitives::AccountId &who) const {
    auto it = balances_.find(who);
    return it == balances_.end() ? 0 : it->second;
  }

}  // namespace blindbid::escrow
