/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/state_sync_configuration.hpp"

#include <cstdio>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace ledgersync::application {

  /**
   * Reads state sync configuration from the command line and an optional
   * JSON file. Command line values override values of the file.
   */
  class StateSyncConfigurationImpl final : public StateSyncConfiguration {
   public:
    StateSyncConfigurationImpl();

    /**
     * @return true if the configuration is complete and valid, false if it
     * is not or if help was requested
     */
    bool initializeFromArgs(int argc, const char **argv);

    const state_sync::StateSyncDriverConfig &driverConfig() const override {
      return config_;
    }

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

    FilePtr open_file(const std::string &filepath);

    bool read_config_from_file(const std::string &filepath);

    bool parse_general_segment(const rapidjson::Value &val);
    bool parse_state_sync_segment(const rapidjson::Value &val);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u64(const rapidjson::Value &val,
                  const char *name,
                  uint64_t &target);

    bool validate_config() const;

    state_sync::StateSyncDriverConfig config_;
    std::vector<std::string> logger_tuning_config_;
    log::Logger logger_;
  };

}  // namespace ledgersync::application
