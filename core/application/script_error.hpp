/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace blindbid::application {

  enum class ScriptError : uint8_t {
    UNKNOWN_COMMAND = 1,
    WRONG_ARGUMENT_COUNT,
    INVALID_NUMBER,
    INVALID_FLAG,
    INVALID_SECRET,
    INVALID_REVEAL,
    CONSERVATION_VIOLATED,
  };

}  // namespace blindbid::application

OUTCOME_HPP_DECLARE_ERROR(blindbid::application, ScriptError);
