/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "escrow/escrow.hpp"

#include <unordered_map>
#include <unordered_set>

#include "log/logger.hpp"

namespace blindbid::escrow {

  /**
   * Escrow keeping account balances in memory. Accounts may be frozen to
   * make transfers to them fail.
   */
  class InMemoryEscrow : public Escrow {
   public:
    InMemoryEscrow();

    ~InMemoryEscrow() override = default;

    outcome::result<void> collect(const primitives::AccountId &from,
                                  primitives::Balance amount) override;

    outcome::result<void> transfer(const primitives::AccountId &to,
                                   primitives::Balance amount) override;

    /// credits an account with funds from outside
    outcome::result<void> fund(const primitives::AccountId &who,
                               primitives::Balance amount);

    void freeze(const primitives::AccountId &who);

    void unfreeze(const primitives::AccountId &who);

    primitives::Balance balanceOf(const primitives::AccountId &who) const;

    /// funds currently in custody
    primitives::Balance held() const {
      return held_;
    }

   private:
    std::unordered_map<primitives::AccountId, primitives::Balance> balances_;
    std::unordered_set<primitives::AccountId> frozen_;
    primitives::Balance held_ = 0;
    log::Logger logger_;
  };

}  // namespace blindbid::escrow
