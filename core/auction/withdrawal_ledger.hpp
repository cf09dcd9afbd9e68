/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include "auction/types.hpp"
#include "outcome/outcome.hpp"

namespace blindbid::auction {

  /**
   * Amounts owed to principals, released on their request
   */
  class WithdrawalLedger {
   public:
    /**
     * Adds to the amount owed to a principal
     * @return ArithmeticError::Overflow if the total owed would overflow
     */
    outcome::result<void> credit(const AccountId &who, Balance amount);

    /**
     * Zeroes the principal's entry
     * @return the amount which was owed
     */
    Balance take(const AccountId &who);

    Balance owed(const AccountId &who) const;

    /// sum of all entries
    Balance outstanding() const {
      return outstanding_;
    }

   private:
    std::unordered_map<AccountId, Balance> owed_;
    Balance outstanding_ = 0;
  };

}  // namespace blindbid::auction
