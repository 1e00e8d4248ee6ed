/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "events/event_notification_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ledgersync::events, EventNotificationError, e) {
  using E = ledgersync::events::EventNotificationError;
  switch (e) {
    case E::VERSION_NOT_INCREASING:
      return "Events version is not greater than the last notified one";
  }
  return "Unknown EventNotificationError";
}
