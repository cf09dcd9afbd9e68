/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace blindbid::escrow {

  enum class EscrowError {
    INSUFFICIENT_FUNDS = 1,
    DESTINATION_FROZEN,
    BALANCE_OVERFLOW,
  };

}  // namespace blindbid::escrow

OUTCOME_HPP_DECLARE_ERROR(blindbid::escrow, EscrowError);
