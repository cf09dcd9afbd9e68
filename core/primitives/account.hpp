/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"

BLINDBID_BLOB_STRICT_TYPEDEF(blindbid::primitives, AccountId, 32);

namespace blindbid::primitives {

  using Balance = uint64_t;

}  // namespace blindbid::primitives
