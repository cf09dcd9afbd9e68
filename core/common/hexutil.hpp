/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace blindbid::common {

  class BufferView;

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    VALUE_OUT_OF_RANGE,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace blindbid::common

OUTCOME_HPP_DECLARE_ERROR(blindbid::common, UnhexError);

namespace blindbid::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes source bytes
   * @return hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes source bytes
   * @return hexstring
   */
  std::string hex_lower_0x(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string without prefix
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace blindbid::common
