/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blindbid::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return name of the principal receiving the winning bid
     */
    virtual const std::string &beneficiary() const = 0;

    /**
     * @return how long bids are accepted, counted from the auction start
     */
    virtual std::chrono::seconds biddingTime() const = 0;

    /**
     * @return how long bids may be revealed once bidding is over
     */
    virtual std::chrono::seconds revealTime() const = 0;

    /**
     * @return path to the script of auction commands, stdin is read when
     * empty
     */
    virtual std::optional<std::filesystem::path> scriptPath() const = 0;

    /**
     * @return logging tuning chunks, `level` or `group=level`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace blindbid::application
