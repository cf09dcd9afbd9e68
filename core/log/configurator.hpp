/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace blindbid::log {

  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    /// Uses the embedded configuration
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    /**
     * Looks up `--logcfg` among command line arguments, ignoring all others
     */
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace blindbid::log
