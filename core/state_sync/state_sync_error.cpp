/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/state_sync_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ledgersync::state_sync, StateSyncError, e) {
  using E = ledgersync::state_sync::StateSyncError;
  switch (e) {
    case E::DATA_STREAM_NOTIFICATION_TIMEOUT:
      return "Timed out waiting for a data stream notification";
    case E::CRITICAL_DATA_STREAM_TIMEOUT:
      return "Data stream reached the maximum number of consecutive timeouts";
    case E::VERIFICATION_ERROR:
      return "Ledger info verification failed";
    case E::INVALID_PAYLOAD:
      return "Notification payload is invalid at this point of the stream";
    case E::INTEGER_OVERFLOW:
      return "Synced version overflowed";
    case E::STORAGE_ERROR:
      return "Storage is missing or has inconsistent committed data";
    case E::NOTIFICATION_ERROR:
      return "Failed to notify about committed data";
    case E::SYNC_STOPPED:
      return "State sync is stopped";
  }
  return "Unknown StateSyncError";
}

namespace ledgersync::state_sync {

  bool isFatal(const std::error_code &error) {
    // failures of collaborators (streaming client, storage synchronizer)
    // only invalidate the current stream
    return error == StateSyncError::INTEGER_OVERFLOW
        or error == StateSyncError::STORAGE_ERROR;
  }

}  // namespace ledgersync::state_sync
