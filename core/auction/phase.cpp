/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/phase.hpp"

namespace blindbid::auction {

  Phase derivePhase(const AuctionConfig &config, TimePoint now, bool ended) {
    if (ended) {
      return Phase::Ended;
    }
    if (now < config.bidding_end) {
      return Phase::Bidding;
    }
    if (now < config.reveal_end) {
      return Phase::Reveal;
    }
    return Phase::Settleable;
  }

  std::string_view toString(Phase phase) {
    switch (phase) {
      case Phase::Bidding:
        return "bidding";
      case Phase::Reveal:
        return "reveal";
      case Phase::Settleable:
        return "settleable";
      case Phase::Ended:
        return "ended";
    }
    return "unknown";
  }

}  // namespace blindbid::auction
