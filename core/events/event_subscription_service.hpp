/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "primitives/contract_event.hpp"

namespace ledgersync::events {

  /**
   * Fans out events of committed transactions to in-process subscribers
   */
  class EventSubscriptionService {
   public:
    virtual ~EventSubscriptionService() = default;

    /**
     * Delivers {@param events} committed at {@param version}
     */
    virtual outcome::result<void> notifyEvents(
        primitives::Version version,
        const std::vector<primitives::ContractEvent> &events) = 0;
  };

}  // namespace ledgersync::events
