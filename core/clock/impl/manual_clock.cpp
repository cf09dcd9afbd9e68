/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/manual_clock.hpp"

namespace blindbid::clock {

  ManualClock::ManualClock(TimePoint start)
      : ticks_{start.time_since_epoch().count()} {}

  ManualClock::TimePoint ManualClock::now() const {
    return TimePoint{Duration{ticks_.load()}};
  }

  uint64_t ManualClock::nowUint64() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
               now().time_since_epoch())
        .count();
  }

  void ManualClock::advance(Duration duration) {
    if (duration.count() <= 0) {
      return;
    }
    ticks_ += duration.count();
  }

}  // namespace blindbid::clock
