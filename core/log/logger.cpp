/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>
#include <sstream>

#include <boost/assert.hpp>
#include <libp2p/log/logger.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(ledgersync::log, Error, e) {
  using E = ledgersync::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
  }
  return "Unknown log::Error";
}

namespace ledgersync::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem>
    ensure_logger_system_is_initialized() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(
          logging_system,
          "Logging system is not ready. "
          "ledgersync::log::setLoggingSystem() must be executed once before");
      return logging_system;
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    } else if (str == "debug") {
      return Level::DEBUG;
    } else if (str == "verbose") {
      return Level::VERBOSE;
    } else if (str == "info" or str == "inf") {
      return Level::INFO;
    } else if (str == "warning" or str == "warn") {
      return Level::WARN;
    } else if (str == "error" or str == "err") {
      return Level::ERROR;
    } else if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    } else if (str == "off" or str == "no") {
      return Level::OFF;
    } else {
      return Error::WRONG_LEVEL;
    }
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  void tuneLoggingSystem(const std::vector<std::string> &cfg) {
    auto logging_system = ensure_logger_system_is_initialized();

    for (auto &chunk : cfg) {
      if (auto res = str2lvl(chunk); res.has_value()) {
        setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      std::istringstream iss(chunk);

      std::string group_name;
      if (not std::getline(iss, group_name, '=')) {
        std::cerr << "Can't read group" << std::endl;
        continue;
      }
      if (not logging_system->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << std::endl;
        continue;
      }

      std::string level_string;
      if (not std::getline(iss, level_string)) {
        std::cerr << "Can't read level for group '" << group_name << "'"
                  << std::endl;
        continue;
      }
      auto res = str2lvl(level_string);
      if (not res.has_value()) {
        std::cerr << "Invalid level: " << level_string << std::endl;
        continue;
      }

      logging_system->setLevelOfGroup(group_name, res.value());
    }
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    auto logging_system = ensure_logger_system_is_initialized();
    return std::static_pointer_cast<soralog::LoggerFactory>(logging_system)
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    auto logging_system = ensure_logger_system_is_initialized();
    return logging_system->setLevelOfGroup(group_name, level);
  }

}  // namespace ledgersync::log
