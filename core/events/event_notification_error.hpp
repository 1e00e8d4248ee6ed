/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace ledgersync::events {

  enum class EventNotificationError {
    VERSION_NOT_INCREASING = 1,
  };

}  // namespace ledgersync::events

OUTCOME_HPP_DECLARE_ERROR(ledgersync::events, EventNotificationError);
