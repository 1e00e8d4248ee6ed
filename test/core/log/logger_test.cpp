/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using ledgersync::log::Level;
using ledgersync::log::str2lvl;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given level names and their short forms
 * @when parsing them
 * @then matching levels are returned
 */
TEST_F(LoggerTest, ParseLevel) {
  EXPECT_OUTCOME_TRUE(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(crit, str2lvl("crit"));
  EXPECT_EQ(crit, Level::CRITICAL);
  EXPECT_OUTCOME_TRUE(off, str2lvl("off"));
  EXPECT_EQ(off, Level::OFF);
}

/**
 * @given unknown level name
 * @when parsing it
 * @then wrong level error is returned
 */
TEST_F(LoggerTest, ParseUnknownLevel) {
  EXPECT_EC(str2lvl("loud"), ledgersync::log::Error::WRONG_LEVEL);
  EXPECT_EC(str2lvl("Trace"), ledgersync::log::Error::WRONG_LEVEL);
}

/**
 * @given logger of the driver group
 * @when the group level is tuned by a "<group>=<level>" override
 * @then the logger follows the new level, malformed overrides are skipped
 */
TEST_F(LoggerTest, TuneGroupLevel) {
  auto logger = ledgersync::log::createLogger("TuneTest", "driver");
  auto initial_level = logger->level();

  ledgersync::log::tuneLoggingSystem(
      {"driver=critical", "no_such_group=trace", "driver=loud", "driver"});
  EXPECT_EQ(logger->level(), Level::CRITICAL);

  ledgersync::log::tuneLoggingSystem({"driver=trace"});
  EXPECT_EQ(logger->level(), Level::TRACE);

  ledgersync::log::setLevelOfGroup("driver", initial_level);
}

/**
 * @given logger of the events group
 * @when the level of its group and of an undeclared group are set
 * @then only the declared group is changed
 */
TEST_F(LoggerTest, SetLevelOfGroup) {
  auto logger = ledgersync::log::createLogger("GroupTest", "events");
  auto initial_level = logger->level();

  EXPECT_TRUE(ledgersync::log::setLevelOfGroup("events", Level::ERROR));
  EXPECT_EQ(logger->level(), Level::ERROR);
  EXPECT_FALSE(ledgersync::log::setLevelOfGroup("no_such_group", Level::OFF));

  ledgersync::log::setLevelOfGroup("events", initial_level);
}
