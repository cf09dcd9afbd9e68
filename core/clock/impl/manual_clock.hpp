/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "clock/clock.hpp"

namespace blindbid::clock {

  /**
   * System clock which only moves when told to. Used to replay auctions
   * deterministically.
   */
  class ManualClock : public SystemClock {
   public:
    explicit ManualClock(TimePoint start);

    TimePoint now() const override;

    uint64_t nowUint64() const override;

    /**
     * Moves the clock forward. Negative durations are ignored, the clock
     * never goes back.
     */
    void advance(Duration duration);

   private:
    std::atomic<Duration::rep> ticks_;
  };

}  // namespace blindbid::clock
