/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <span>

namespace blindbid::common {

  /// Read-only bytes handed to hashing and hex encoding
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    bool operator==(const BufferView &other) const {
      return std::equal(begin(), end(), other.begin(), other.end());
    }
  };

}  // namespace blindbid::common

namespace blindbid {
  using common::BufferView;
}  // namespace blindbid
