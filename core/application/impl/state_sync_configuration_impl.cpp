/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/state_sync_configuration_impl.hpp"

#include <array>
#include <chrono>
#include <iostream>
#include <optional>
#include <string_view>
#include <type_traits>

#include <boost/program_options.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

namespace {
  using ledgersync::state_sync::ContinuousSyncingMode;

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

  std::optional<ContinuousSyncingMode> str_to_syncing_mode(
      std::string_view str) {
    if (str == "ApplyTransactionOutputs") {
      return ContinuousSyncingMode::ApplyTransactionOutputs;
    }
    if (str == "ExecuteTransactions") {
      return ContinuousSyncingMode::ExecuteTransactions;
    }
    return std::nullopt;
  }

  /// Durations must stay within the range of the clock they are waited on
  template <typename Duration>
  std::optional<Duration> to_duration(uint64_t value) {
    constexpr auto max = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::duration::max() / 2);
    if (value > static_cast<uint64_t>(max.count())) {
      return std::nullopt;
    }
    return Duration(static_cast<typename Duration::rep>(value));
  }

  const uint64_t def_max_stream_wait_time_ms = 5000;
  const uint64_t def_max_stream_timeouts = 3;
  const std::string def_syncing_mode = "ApplyTransactionOutputs";
  const uint64_t def_max_chunk_size = 2000;
  const uint64_t def_pending_data_log_interval_sec = 3;
  const uint64_t def_progress_check_interval_ms = 100;
}  // namespace

namespace ledgersync::application {

  StateSyncConfigurationImpl::StateSyncConfigurationImpl()
      : logger_{log::createLogger("Configuration", "application")} {}

  StateSyncConfigurationImpl::FilePtr StateSyncConfigurationImpl::open_file(
      const std::string &filepath) {
    return FilePtr(std::fopen(filepath.c_str(), "r"), &std::fclose);
  }

  bool StateSyncConfigurationImpl::load_ms(const rapidjson::Value &val,
                                           const char *name,
                                           std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return true;
    }
    if (not m->value.IsArray()) {
      SL_ERROR(logger_, "Config value '{}' must be an array of strings", name);
      return false;
    }
    std::vector<std::string> values;
    for (auto &v : m->value.GetArray()) {
      if (not v.IsString()) {
        SL_ERROR(
            logger_, "Config value '{}' must be an array of strings", name);
        return false;
      }
      values.emplace_back(v.GetString(), v.GetStringLength());
    }
    target = std::move(values);
    return true;
  }

  bool StateSyncConfigurationImpl::load_str(const rapidjson::Value &val,
                                            const char *name,
                                            std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return true;
    }
    if (not m->value.IsString()) {
      SL_ERROR(logger_, "Config value '{}' must be a string", name);
      return false;
    }
    target.assign(m->value.GetString(), m->value.GetStringLength());
    return true;
  }

  bool StateSyncConfigurationImpl::load_u64(const rapidjson::Value &val,
                                            const char *name,
                                            uint64_t &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return true;
    }
    if (not m->value.IsUint64()) {
      SL_ERROR(logger_, "Config value '{}' must be an unsigned integer", name);
      return false;
    }
    target = m->value.GetUint64();
    return true;
  }

  bool StateSyncConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    return load_ms(val, "log", logger_tuning_config_);
  }

  bool StateSyncConfigurationImpl::parse_state_sync_segment(
      const rapidjson::Value &val) {
    uint64_t wait_time_ms = config_.max_stream_wait_time.count();
    uint64_t log_interval_sec = config_.pending_data_log_interval.count();
    uint64_t check_interval_ms = config_.progress_check_interval.count();
    std::string mode;
    auto ok = load_u64(val, "max-stream-wait-time-ms", wait_time_ms)
          and load_u64(val, "max-stream-timeouts",
                       config_.max_num_stream_timeouts)
          and load_u64(val, "max-chunk-size",
                       config_.max_transaction_chunk_size)
          and load_u64(val, "pending-data-log-interval-sec", log_interval_sec)
          and load_u64(val, "progress-check-interval-ms", check_interval_ms)
          and load_str(val, "continuous-syncing-mode", mode);
    if (not ok) {
      return false;
    }
    auto wait_time = to_duration<std::chrono::milliseconds>(wait_time_ms);
    auto log_interval = to_duration<std::chrono::seconds>(log_interval_sec);
    auto check_interval =
        to_duration<std::chrono::milliseconds>(check_interval_ms);
    if (not wait_time or not log_interval or not check_interval) {
      SL_ERROR(logger_, "Config contains an interval out of range");
      return false;
    }
    config_.max_stream_wait_time = wait_time.value();
    config_.pending_data_log_interval = log_interval.value();
    config_.progress_check_interval = check_interval.value();
    if (not mode.empty()) {
      auto mode_opt = str_to_syncing_mode(mode);
      if (not mode_opt) {
        SL_ERROR(logger_, "Invalid continuous syncing mode: '{}'", mode);
        return false;
      }
      config_.continuous_syncing_mode = mode_opt.value();
    }
    return true;
  }

  bool StateSyncConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with --state-sync-config option",
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
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} must hold an object", filepath);
      return false;
    }

    if (auto it = document.FindMember("general");
        it != document.MemberEnd() and not parse_general_segment(it->value)) {
      return false;
    }
    if (auto it = document.FindMember("state_sync");
        it != document.MemberEnd()
        and not parse_state_sync_segment(it->value)) {
      return false;
    }
    return true;
  }

  bool StateSyncConfigurationImpl::validate_config() const {
    if (config_.max_stream_wait_time.count() <= 0) {
      SL_ERROR(logger_, "Stream wait time must be positive");
      return false;
    }
    if (config_.max_num_stream_timeouts == 0) {
      SL_ERROR(logger_, "Number of stream timeouts must be positive");
      return false;
    }
    if (config_.max_transaction_chunk_size == 0) {
      SL_ERROR(logger_, "Transaction chunk size must be positive");
      return false;
    }
    if (config_.progress_check_interval.count() <= 0) {
      SL_ERROR(logger_, "Progress check interval must be positive");
      return false;
    }
    if (config_.pending_data_log_interval.count() < 0) {
      SL_ERROR(logger_, "Pending data log interval must not be negative");
      return false;
    }
    return true;
  }

  bool StateSyncConfigurationImpl::initializeFromArgs(int argc,
                                                      const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -llibp2p=off.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("state-sync-config,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description sync_desc("State sync options");
    sync_desc.add_options()
        ("max-stream-wait-time-ms", po::value<uint64_t>()->default_value(def_max_stream_wait_time_ms),
          "maximum time to wait for a data stream notification")
        ("max-stream-timeouts", po::value<uint64_t>()->default_value(def_max_stream_timeouts),
          "number of consecutive timeouts after which the data stream is recreated")
        ("continuous-syncing-mode", po::value<std::string>()->default_value(def_syncing_mode),
          "possible values: ApplyTransactionOutputs, ExecuteTransactions")
        ("max-chunk-size", po::value<uint64_t>()->default_value(def_max_chunk_size),
          "maximum number of transactions in a single notification")
        ("pending-data-log-interval-sec", po::value<uint64_t>()->default_value(def_pending_data_log_interval_sec),
          "minimal interval between logs about waiting for data")
        ("progress-check-interval-ms", po::value<uint64_t>()->default_value(def_progress_check_interval_ms),
          "pause before retrying after a failed sync iteration")
        ;
    // clang-format on

    desc.add(sync_desc);

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

    bool file_error = false;
    find_argument<std::string>(
        vm, "state-sync-config", [&](const std::string &path) {
          file_error = not read_config_from_file(path);
        });
    if (file_error) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });

    bool interval_error = false;
    auto set_interval = [&](const char *name, auto &target) {
      find_argument<uint64_t>(vm, name, [&](uint64_t val) {
        auto interval =
            to_duration<std::remove_reference_t<decltype(target)>>(val);
        if (not interval) {
          interval_error = true;
          SL_ERROR(logger_, "Value {} of '{}' is out of range", val, name);
          return;
        }
        target = interval.value();
      });
    };
    set_interval("max-stream-wait-time-ms", config_.max_stream_wait_time);
    set_interval("pending-data-log-interval-sec",
                 config_.pending_data_log_interval);
    set_interval("progress-check-interval-ms",
                 config_.progress_check_interval);
    if (interval_error) {
      return false;
    }

    find_argument<uint64_t>(vm, "max-stream-timeouts", [&](uint64_t val) {
      config_.max_num_stream_timeouts = val;
    });
    find_argument<uint64_t>(vm, "max-chunk-size", [&](uint64_t val) {
      config_.max_transaction_chunk_size = val;
    });

    bool mode_value_error = false;
    find_argument<std::string>(
        vm, "continuous-syncing-mode", [&](const std::string &val) {
          auto mode_opt = str_to_syncing_mode(val);
          if (not mode_opt) {
            mode_value_error = true;
            SL_ERROR(logger_, "Invalid continuous syncing mode: '{}'", val);
          } else {
            config_.continuous_syncing_mode = mode_opt.value();
          }
        });
    if (mode_value_error) {
      return false;
    }

    return validate_config();
  }

}  // namespace ledgersync::application
