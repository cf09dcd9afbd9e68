/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace blindbid::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_LOGGER };

  outcome::result<Level> str2lvl(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies tuning chunks of form `level` (applied to the default group) or
   * `group=level`
   */
  void tuneLoggingSystem(const std::vector<std::string> &cfg);

  static const std::string defaultGroupName("blindbid");

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group,
                                    Level level);

  bool setLevelOfGroup(const std::string &group_name, Level level);
  bool resetLevelOfGroup(const std::string &group_name);

}  // namespace blindbid::log

OUTCOME_HPP_DECLARE_ERROR(blindbid::log, Error);
