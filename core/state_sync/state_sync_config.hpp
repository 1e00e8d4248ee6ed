/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace ledgersync::state_sync {

  /// Kind of data requested from peers while following the network head
  enum class ContinuousSyncingMode {
    /// Apply transaction outputs without re-executing transactions
    ApplyTransactionOutputs,
    /// Execute transactions locally
    ExecuteTransactions,
  };

  struct StateSyncDriverConfig {
    /// Maximum time to wait for a single data stream notification
    std::chrono::milliseconds max_stream_wait_time{5000};
    /// Consecutive timeouts after which the stream is recreated
    uint64_t max_num_stream_timeouts = 3;
    ContinuousSyncingMode continuous_syncing_mode =
        ContinuousSyncingMode::ApplyTransactionOutputs;
    /// Larger batches are rejected as invalid
    uint64_t max_transaction_chunk_size = 2000;
    /// Minimal interval between "waiting for data" log lines
    std::chrono::seconds pending_data_log_interval{3};
    /// Pause before the next attempt after a failed sync iteration
    std::chrono::milliseconds progress_check_interval{100};
  };

}  // namespace ledgersync::state_sync
