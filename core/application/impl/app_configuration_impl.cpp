/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  const std::string def_beneficiary = "beneficiary";
  const uint32_t def_bidding_time = 3600;
  const uint32_t def_reveal_time = 3600;
}  // namespace

namespace blindbid::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        beneficiary_(def_beneficiary),
        bidding_time_(def_bidding_time),
        reveal_time_(def_reveal_time) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    if (not m->value.IsArray()) {
      return false;
    }
    for (auto &value : m->value.GetArray()) {
      if (value.IsString()) {
        target.emplace_back(value.GetString(), value.GetStringLength());
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);

    std::string script;
    if (load_str(val, "script", script)) {
      script_path_ = script;
    }
  }

  void AppConfigurationImpl::parse_auction_segment(
      const rapidjson::Value &val) {
    load_str(val, "beneficiary", beneficiary_);

    uint32_t seconds = 0;
    if (load_u32(val, "bidding-time", seconds)) {
      bidding_time_ = std::chrono::seconds{seconds};
    }
    if (load_u32(val, "reveal-time", seconds)) {
      reveal_time_ = std::chrono::seconds{seconds};
    }
  }

  bool AppConfigurationImpl::validate_config() {
    if (beneficiary_.empty()) {
      SL_ERROR(logger_,
               "Beneficiary is empty, "
               "please specify it with --beneficiary option");
      return false;
    }

    if (bidding_time_.count() == 0) {
      SL_ERROR(logger_,
               "Bidding time is 0, "
               "please specify a positive value with --bidding-time option");
      return false;
    }

    if (reveal_time_.count() == 0) {
      SL_ERROR(logger_,
               "Reveal time is 0, "
               "please specify a positive value with --reveal-time option");
      return false;
    }

    if (script_path_.has_value()
        and not std::filesystem::is_regular_file(script_path_.value())) {
      SL_ERROR(logger_,
               "Script path {} does not exist, "
               "please specify a valid path with --script option",
               script_path_->string());
      return false;
    }

    return true;
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lauction=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to the YAML configuration of logging")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description auction_desc("Auction options");
    auction_desc.add_options()
        ("beneficiary", po::value<std::string>()->default_value(def_beneficiary), "name of the principal the winning bid is paid to")
        ("bidding-time", po::value<uint32_t>()->default_value(def_bidding_time), "seconds during which bids are accepted")
        ("reveal-time", po::value<uint32_t>()->default_value(def_reveal_time), "seconds after bidding during which bids may be revealed")
        ("script", po::value<std::string>(), "file with auction commands, stdin is read if omitted")
        ;
    // clang-format on

    desc.add(auction_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool file_ok = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      file_ok = read_config_from_file(path);
    });
    if (not file_ok) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });

    find_argument<std::string>(
        vm, "beneficiary", [&](const std::string &val) { beneficiary_ = val; });

    find_argument<uint32_t>(vm, "bidding-time", [&](uint32_t val) {
      bidding_time_ = std::chrono::seconds{val};
    });

    find_argument<uint32_t>(vm, "reveal-time", [&](uint32_t val) {
      reveal_time_ = std::chrono::seconds{val};
    });

    find_argument<std::string>(
        vm, "script", [&](const std::string &val) { script_path_ = val; });

    return validate_config();
  }

}  // namespace blindbid::application
