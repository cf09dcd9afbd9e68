/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace blindbid::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 sha2_256(common::BufferView data) const override;
  };

}  // namespace blindbid::crypto
