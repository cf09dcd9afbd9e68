/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "outcome/outcome.hpp"

namespace blindbid::primitives {

  enum class ArithmeticError : uint8_t {
    /// Underflow.
    Underflow = 1,
    /// Overflow.
    Overflow,
  };

}  // namespace blindbid::primitives

OUTCOME_HPP_DECLARE_ERROR(blindbid::primitives, ArithmeticError);
