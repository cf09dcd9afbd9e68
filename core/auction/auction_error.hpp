/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace blindbid::auction {

  enum class AuctionError {
    /// operation is not allowed in the current auction phase
    PHASE_VIOLATION = 1,
    /// revealed values do not line up with the recorded bids
    LENGTH_MISMATCH,
    /// revealed triple does not hash to the stored commitment
    UNVERIFIED_COMMITMENT,
    ALREADY_ENDED,
    TRANSFER_FAILURE,
    INVALID_DEADLINES,
    EMPTY_COMMITMENT,
  };

}  // namespace blindbid::auction

OUTCOME_HPP_DECLARE_ERROR(blindbid::auction, AuctionError);
