/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>
#include <iostream>

#include <libp2p/common/final_action.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/script_runner.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using blindbid::application::AppConfigurationImpl;
using blindbid::application::ScriptRunner;

namespace {
  int run_auction(int argc, const char **argv) {
    auto logger =
        blindbid::log::createLogger("Main", blindbid::log::defaultGroupName);

    auto configuration = std::make_shared<AppConfigurationImpl>(
        blindbid::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    blindbid::log::tuneLoggingSystem(configuration->log());

    auto runner = ScriptRunner::create(
        *configuration, std::make_shared<blindbid::crypto::HasherImpl>());
    if (runner.has_error()) {
      SL_ERROR(logger,
               "Auction could not be created: {}",
               runner.error().message());
      return EXIT_FAILURE;
    }

    SL_INFO(logger,
            "Auction for {} started: bidding {}s, reveal {}s",
            configuration->beneficiary(),
            configuration->biddingTime().count(),
            configuration->revealTime().count());

    outcome::result<void> result = outcome::success();
    if (auto path = configuration->scriptPath(); path.has_value()) {
      std::ifstream script{path.value()};
      if (not script.is_open()) {
        SL_ERROR(logger, "Script {} can not be opened", path->string());
        return EXIT_FAILURE;
      }
      result = runner.value()->run(script, std::cout);
    } else {
      result = runner.value()->run(std::cin, std::cout);
    }

    if (result.has_error()) {
      SL_ERROR(logger, "Script stopped: {}", result.error().message());
      logger->flush();
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Script completed");
    logger->flush();

    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        blindbid::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<blindbid::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<blindbid::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  blindbid::log::setLoggingSystem(logging_system);

  return run_auction(argc, argv);
}
