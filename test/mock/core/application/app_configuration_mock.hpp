/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <gmock/gmock.h>

namespace blindbid::application {

  class AppConfigurationMock : public AppConfiguration {
   public:
    MOCK_METHOD(const std::string &, beneficiary, (), (const, override));

    MOCK_METHOD(std::chrono::seconds, biddingTime, (), (const, override));

    MOCK_METHOD(std::chrono::seconds, revealTime, (), (const, override));

    MOCK_METHOD(std::optional<std::filesystem::path>,
                scriptPath,
                (),
                (const, override));

    MOCK_METHOD(const std::vector<std::string> &,
                log,
                (),
                (const, override));
  };

}  // namespace blindbid::application
