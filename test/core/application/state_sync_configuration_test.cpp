/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/state_sync_configuration_impl.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

#include "testutil/prepare_loggers.hpp"

using ledgersync::application::StateSyncConfigurationImpl;
using ledgersync::state_sync::ContinuousSyncingMode;
using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;

class StateSyncConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  boost::filesystem::path tmp_dir = boost::filesystem::temp_directory_path()
                                    / boost::filesystem::unique_path();
  std::string config_path = (tmp_dir / "config.json").native();
  std::string invalid_config_path = (tmp_dir / "invalid_config.json").native();
  std::string damaged_config_path = (tmp_dir / "damaged_config.json").native();

  static constexpr char const *file_content =
      R"({
        "general" : {
          "log" : ["debug", "state_sync=trace"]
        },
        "state_sync" : {
          "max-stream-wait-time-ms" : 1500,
          "max-stream-timeouts" : 5,
          "continuous-syncing-mode" : "ExecuteTransactions",
          "max-chunk-size" : 100,
          "pending-data-log-interval-sec" : 10,
          "progress-check-interval-ms" : 50
        }
      })";
  static constexpr char const *invalid_file_content =
      R"({
        "state_sync" : {
          "max-stream-wait-time-ms" : "fast",
          "max-stream-timeouts" : -1
        }
      })";
  static constexpr char const *damaged_file_content =
      R"({
        "state_sync" : {
          "max-stream-wait-time-ms" : 1500,
      })";

  void SetUp() override {
    boost::filesystem::create_directory(tmp_dir);
    ASSERT_TRUE(boost::filesystem::exists(tmp_dir));

    auto spawn_file = [](std::string const &path,
                         std::string const &file_content) {
      std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
      file << file_content;
    };

    spawn_file(config_path, file_content);
    spawn_file(invalid_config_path, invalid_file_content);
    spawn_file(damaged_config_path, damaged_file_content);

    config_ = std::make_unique<StateSyncConfigurationImpl>();
  }

  void TearDown() override {
    config_.reset();
    boost::filesystem::remove_all(tmp_dir);
  }

  std::unique_ptr<StateSyncConfigurationImpl> config_;
};

/**
 * @given new configuration
 * @when no arguments are given
 * @then defaults are used
 */
TEST_F(StateSyncConfigurationTest, Defaults) {
  char const *args[] = {"ledgersync"};
  ASSERT_TRUE(config_->initializeFromArgs(std::size(args), args));

  auto &config = config_->driverConfig();
  EXPECT_EQ(config.max_stream_wait_time, 5000ms);
  EXPECT_EQ(config.max_num_stream_timeouts, 3);
  EXPECT_EQ(config.continuous_syncing_mode,
            ContinuousSyncingMode::ApplyTransactionOutputs);
  EXPECT_EQ(config.max_transaction_chunk_size, 2000);
  EXPECT_EQ(config.pending_data_log_interval, 3s);
  EXPECT_EQ(config.progress_check_interval, 100ms);
  EXPECT_TRUE(config_->log().empty());
}

/**
 * @given new configuration
 * @when state sync options are given on the command line
 * @then they are applied
 */
TEST_F(StateSyncConfigurationTest, CommandLineOptions) {
  char const *args[] = {"ledgersync",
                        "--max-stream-wait-time-ms",
                        "200",
                        "--max-stream-timeouts",
                        "7",
                        "--continuous-syncing-mode",
                        "ExecuteTransactions",
                        "--max-chunk-size",
                        "10",
                        "-l",
                        "debug"};
  ASSERT_TRUE(config_->initializeFromArgs(std::size(args), args));

  auto &config = config_->driverConfig();
  EXPECT_EQ(config.max_stream_wait_time, 200ms);
  EXPECT_EQ(config.max_num_stream_timeouts, 7);
  EXPECT_EQ(config.continuous_syncing_mode,
            ContinuousSyncingMode::ExecuteTransactions);
  EXPECT_EQ(config.max_transaction_chunk_size, 10);
  EXPECT_EQ(config_->log(), std::vector<std::string>{"debug"});
}

/**
 * @given configuration file with all state sync options
 * @when it is passed with --state-sync-config
 * @then values of the file are applied
 */
TEST_F(StateSyncConfigurationTest, ConfigFile) {
  char const *args[] = {
      "ledgersync", "--state-sync-config", config_path.c_str()};
  ASSERT_TRUE(config_->initializeFromArgs(std::size(args), args));

  auto &config = config_->driverConfig();
  EXPECT_EQ(config.max_stream_wait_time, 1500ms);
  EXPECT_EQ(config.max_num_stream_timeouts, 5);
  EXPECT_EQ(config.continuous_syncing_mode,
            ContinuousSyncingMode::ExecuteTransactions);
  EXPECT_EQ(config.max_transaction_chunk_size, 100);
  EXPECT_EQ(config.pending_data_log_interval, 10s);
  EXPECT_EQ(config.progress_check_interval, 50ms);
  EXPECT_EQ(config_->log(),
            (std::vector<std::string>{"debug", "state_sync=trace"}));
}

/**
 * @given configuration file and command line options for the same values
 * @when both are given
 * @then command line wins
 */
TEST_F(StateSyncConfigurationTest, CommandLineOverridesFile) {
  char const *args[] = {"ledgersync",
                        "-c",
                        config_path.c_str(),
                        "--max-stream-timeouts",
                        "9",
                        "--continuous-syncing-mode",
                        "ApplyTransactionOutputs"};
  ASSERT_TRUE(config_->initializeFromArgs(std::size(args), args));

  auto &config = config_->driverConfig();
  EXPECT_EQ(config.max_num_stream_timeouts, 9);
  EXPECT_EQ(config.continuous_syncing_mode,
            ContinuousSyncingMode::ApplyTransactionOutputs);
  EXPECT_EQ(config.max_stream_wait_time, 1500ms);
}

/**
 * @given configuration files with values of wrong types or broken syntax
 * @when they are loaded
 * @then configuration fails
 */
TEST_F(StateSyncConfigurationTest, InvalidConfigFile) {
  char const *invalid[] = {
      "ledgersync", "--state-sync-config", invalid_config_path.c_str()};
  EXPECT_FALSE(config_->initializeFromArgs(std::size(invalid), invalid));

  char const *damaged[] = {
      "ledgersync", "--state-sync-config", damaged_config_path.c_str()};
  EXPECT_FALSE(config_->initializeFromArgs(std::size(damaged), damaged));

  auto missing_path = (tmp_dir / "missing.json").native();
  char const *missing[] = {
      "ledgersync", "--state-sync-config", missing_path.c_str()};
  EXPECT_FALSE(config_->initializeFromArgs(std::size(missing), missing));
}

/**
 * @given command line values out of their domain
 * @when they are parsed
 * @then configuration fails
 */
TEST_F(StateSyncConfigurationTest, InvalidValues) {
  char const *mode[] = {
      "ledgersync", "--continuous-syncing-mode", "DownloadEverything"};
  EXPECT_FALSE(config_->initializeFromArgs(std::size(mode), mode));

  char const *zero_timeouts[] = {"ledgersync", "--max-stream-timeouts", "0"};
  EXPECT_FALSE(
      StateSyncConfigurationImpl{}.initializeFromArgs(std::size(zero_timeouts),
                                                      zero_timeouts));

  char const *zero_chunk[] = {"ledgersync", "--max-chunk-size", "0"};
  EXPECT_FALSE(StateSyncConfigurationImpl{}.initializeFromArgs(
      std::size(zero_chunk), zero_chunk));

  char const *not_a_number[] = {"ledgersync", "--max-chunk-size", "many"};
  EXPECT_FALSE(StateSyncConfigurationImpl{}.initializeFromArgs(
      std::size(not_a_number), not_a_number));
}

/**
 * @given intervals too large for the steady clock, on the command line and
 * in a configuration file
 * @when they are parsed
 * @then configuration fails instead of wrapping to a negative interval
 */
TEST_F(StateSyncConfigurationTest, IntervalsOutOfRange) {
  char const *wait_time[] = {
      "ledgersync", "--max-stream-wait-time-ms", "18446744073709551615"};
  EXPECT_FALSE(config_->initializeFromArgs(std::size(wait_time), wait_time));

  char const *check_interval[] = {
      "ledgersync", "--progress-check-interval-ms", "9223372036854775807"};
  EXPECT_FALSE(StateSyncConfigurationImpl{}.initializeFromArgs(
      std::size(check_interval), check_interval));

  char const *log_interval[] = {
      "ledgersync", "--pending-data-log-interval-sec", "9223372036854775807"};
  EXPECT_FALSE(StateSyncConfigurationImpl{}.initializeFromArgs(
      std::size(log_interval), log_interval));

  auto out_of_range_path = (tmp_dir / "out_of_range.json").native();
  {
    std::ofstream file(out_of_range_path);
    file << R"({
        "state_sync" : {
          "max-stream-wait-time-ms" : 18446744073709551615
        }
      })";
  }
  char const *from_file[] = {
      "ledgersync", "--state-sync-config", out_of_range_path.c_str()};
  EXPECT_FALSE(StateSyncConfigurationImpl{}.initializeFromArgs(
      std::size(from_file), from_file));
}
