/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/epoch_state.hpp"
#include "primitives/ledger_info.hpp"
#include "storage/db_reader.hpp"

namespace ledgersync::state_sync {

  // All functions below fail with STORAGE_ERROR if the requested record is
  // missing or can not be read.

  outcome::result<primitives::EpochState> fetchLatestEpochState(
      const storage::DbReader &storage);

  outcome::result<primitives::LedgerInfoWithSignatures>
  fetchLatestSyncedLedgerInfo(const storage::DbReader &storage);

  outcome::result<primitives::Version> fetchLatestSyncedVersion(
      const storage::DbReader &storage);

}  // namespace ledgersync::state_sync
