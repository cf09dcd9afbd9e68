/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace blindbid::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * @return true if the configuration is complete and valid, false if the
     * application should stop (wrong arguments or `--help`)
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::string &beneficiary() const override {
      return beneficiary_;
    }

    std::chrono::seconds biddingTime() const override {
      return bidding_time_;
    }

    std::chrono::seconds revealTime() const override {
      return reveal_time_;
    }

    std::optional<std::filesystem::path> scriptPath() const override {
      return script_path_;
    }

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_auction_segment(const rapidjson::Value &val);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general", [this](const rapidjson::Value &val) { parse_general_segment(val); }},
        SegmentHandler{"auction", [this](const rapidjson::Value &val) { parse_auction_segment(val); }},
    };
    // clang-format on

    bool validate_config();

    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);

    FilePtr open_file(const std::string &filepath);

    log::Logger logger_;

    std::string beneficiary_;
    std::chrono::seconds bidding_time_;
    std::chrono::seconds reveal_time_;
    std::optional<std::filesystem::path> script_path_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace blindbid::application
