/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

/// Distinct type over Blob<blob_size>, hashable and formattable as the blob
#define BLINDBID_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)        \
  namespace space_name {                                                       \
    struct class_name : public ::blindbid::common::Blob<blob_size> {           \
      using Base = ::blindbid::common::Blob<blob_size>;                        \
                                                                               \
      class_name() = default;                                                  \
      explicit class_name(const Base &blob) : Base{blob} {}                    \
    };                                                                         \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct std::hash<space_name::class_name> {                                   \
    auto operator()(const space_name::class_name &key) const {                 \
      return boost::hash_range(key.cbegin(), key.cend());                      \
    }                                                                          \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct fmt::formatter<space_name::class_name>                                \
      : fmt::formatter<space_name::class_name::Base> {                         \
    template <typename FormatCtx>                                              \
    auto format(const space_name::class_name &blob, FormatCtx &ctx) const      \
        -> decltype(ctx.out()) {                                               \
      return fmt::formatter<space_name::class_name::Base>::format(blob, ctx);  \
    }                                                                          \
  };

namespace blindbid::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Fixed size byte string. Hashes, secrets and account ids are all of this
   * type.
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
    using Array = std::array<byte_t, size_>;

   public:
    // encoded by scale without a length prefix
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    /// zero blob marks a consumed commitment
    bool isZero() const {
      return std::all_of(
          this->begin(), this->end(), [](byte_t b) { return b == 0; });
    }

    std::string toHex() const {
      return hex_lower({this->begin(), this->end()});
    }

    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY(res, unhexWith0x(hex));
      return fromSpan(res);
    }

    static outcome::result<Blob<size_>> fromSpan(const BufferView &span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace blindbid::common

namespace blindbid {
  using common::Hash256;
}  // namespace blindbid

template <size_t N>
struct std::hash<blindbid::common::Blob<N>> {
  auto operator()(const blindbid::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

/// 's' prints the first and last two bytes, 'l' prints every byte
template <size_t N>
struct fmt::formatter<blindbid::common::Blob<N>> {
  char presentation = N > 4 ? 's' : 'l';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }

    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }

    return it;
  }

  template <typename FormatContext>
  auto format(const blindbid::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            blob[0],
                            blob[1],
                            blob[N - 2],
                            blob[N - 1]);
    }

    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(blindbid::common, BlobError);
