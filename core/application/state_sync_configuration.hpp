/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "state_sync/state_sync_config.hpp"

namespace ledgersync::application {

  /**
   * Parsed configuration of the state sync driver
   */
  class StateSyncConfiguration {
   public:
    virtual ~StateSyncConfiguration() = default;

    virtual const state_sync::StateSyncDriverConfig &driverConfig() const = 0;

    /**
     * @return logging tuning as a list of "group=level" or "level" entries
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace ledgersync::application
