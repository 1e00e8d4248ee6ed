/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/storage_utils.hpp"

#include "log/logger.hpp"
#include "state_sync/state_sync_error.hpp"

namespace ledgersync::state_sync {

  namespace {
    log::Logger &logger() {
      static auto logger = log::createLogger("StorageUtils", "state_sync");
      return logger;
    }

    outcome::result<storage::StartupInfo> fetchStartupInfo(
        const storage::DbReader &storage) {
      auto res = storage.getStartupInfo();
      if (res.has_error()) {
        SL_ERROR(logger(),
                 "Failed to read startup info: {}",
                 res.error().message());
        return StateSyncError::STORAGE_ERROR;
      }
      if (not res.value().has_value()) {
        SL_ERROR(logger(), "Startup info is missing, genesis is not committed");
        return StateSyncError::STORAGE_ERROR;
      }
      return std::move(res.value().value());
    }
  }  // namespace

  outcome::result<primitives::EpochState> fetchLatestEpochState(
      const storage::DbReader &storage) {
    OUTCOME_TRY(startup_info, fetchStartupInfo(storage));
    auto epoch_state = startup_info.epochState();
    if (not epoch_state.has_value()) {
      SL_ERROR(logger(),
               "Neither the epoch state nor the latest ledger info "
               "at version {} describe the current validators",
               startup_info.latest_ledger_info.ledger_info.version);
      return StateSyncError::STORAGE_ERROR;
    }
    return std::move(epoch_state.value());
  }

  outcome::result<primitives::LedgerInfoWithSignatures>
  fetchLatestSyncedLedgerInfo(const storage::DbReader &storage) {
    OUTCOME_TRY(startup_info, fetchStartupInfo(storage));
    return std::move(startup_info.latest_ledger_info);
  }

  outcome::result<primitives::Version> fetchLatestSyncedVersion(
      const storage::DbReader &storage) {
    OUTCOME_TRY(fetchStartupInfo(storage));

    auto res = storage.getLatestTransactionInfoOption();
    if (res.has_error()) {
      SL_ERROR(logger(),
               "Failed to read the latest transaction info: {}",
               res.error().message());
      return StateSyncError::STORAGE_ERROR;
    }
    if (not res.value().has_value()) {
      SL_ERROR(logger(),
               "Latest transaction info is missing while startup info exists");
      return StateSyncError::STORAGE_ERROR;
    }
    return res.value()->first;
  }

}  // namespace ledgersync::state_sync
