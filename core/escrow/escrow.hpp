/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/account.hpp"

namespace blindbid::escrow {

  /**
   * Custody of the funds deposited with an auction
   */
  class Escrow {
   public:
    virtual ~Escrow() = default;

    /**
     * Takes a deposit of an account into custody
     * @param from account paying the deposit
     * @param amount amount to take
     * @return error if the account could not pay, in which case nothing is
     * taken
     */
    virtual outcome::result<void> collect(const primitives::AccountId &from,
                                          primitives::Balance amount) = 0;

    /**
     * Pays out of custody to an account
     * @param to destination account
     * @param amount amount to move
     * @return error if funds were not moved, in which case custody is
     * unchanged
     */
    virtual outcome::result<void> transfer(const primitives::AccountId &to,
                                           primitives::Balance amount) = 0;
  };

}  // namespace blindbid::escrow
