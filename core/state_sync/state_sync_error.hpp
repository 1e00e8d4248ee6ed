/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace ledgersync::state_sync {

  enum class StateSyncError {
    /// No notification in time, the fetch may be retried on the same stream
    DATA_STREAM_NOTIFICATION_TIMEOUT = 1,
    /// Too many consecutive timeouts, the stream must be recreated
    CRITICAL_DATA_STREAM_TIMEOUT,
    VERIFICATION_ERROR,
    INVALID_PAYLOAD,
    INTEGER_OVERFLOW,
    STORAGE_ERROR,
    NOTIFICATION_ERROR,
    SYNC_STOPPED,
  };

  /**
   * @return true if no further progress can be made after {@param error},
   * i.e. the committed storage itself can not be trusted
   */
  bool isFatal(const std::error_code &error);

}  // namespace ledgersync::state_sync

OUTCOME_HPP_DECLARE_ERROR(ledgersync::state_sync, StateSyncError);
