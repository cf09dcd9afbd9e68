/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <fmt/format.h>

#include "auction/types.hpp"

namespace blindbid::auction {

  enum class Phase : uint8_t {
    /// commitments are accepted
    Bidding,
    /// bidding closed, commitments may be revealed
    Reveal,
    /// reveal closed, waiting for the settlement payout
    Settleable,
    Ended,
  };

  /**
   * Phase is never stored, it follows from the deadlines, the current time
   * and whether settlement has happened
   */
  Phase derivePhase(const AuctionConfig &config, TimePoint now, bool ended);

  std::string_view toString(Phase phase);

}  // namespace blindbid::auction

template <>
struct fmt::formatter<blindbid::auction::Phase>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(blindbid::auction::Phase phase, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        blindbid::auction::toString(phase), ctx);
  }
};
