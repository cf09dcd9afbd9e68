/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <type_traits>

#include "outcome/outcome.hpp"

namespace blindbid::math {

  template <typename T, typename E>
  inline outcome::result<void> checked_sub(T &x, T y, E e) {
    static_assert(std::numeric_limits<T>::is_integer
                      && !std::numeric_limits<T>::is_signed,
                  "Value must be integer and unsigned!");
    if (x >= y) {
      x -= y;
      return outcome::success();
    }
    return e;
  }

  template <typename T, typename E>
  inline outcome::result<void> checked_add(T &x, T y, E e) {
    static_assert(std::numeric_limits<T>::is_integer
                      && !std::numeric_limits<T>::is_signed,
                  "Value must be integer and unsigned!");
    if (std::numeric_limits<T>::max() - x >= y) {
      x += y;
      return outcome::success();
    }
    return e;
  }

}  // namespace blindbid::math
