/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>
#include <string_view>

#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "primitives/common.hpp"

namespace ledgersync::state_sync {

  /// Values of the `operation` label of the storage synchronizer gauges
  namespace sync_operation {
    inline constexpr std::string_view kAppliedTransactionOutputs =
        "applied_transaction_outputs";
    inline constexpr std::string_view kExecutedTransactions =
        "executed_transactions";
    inline constexpr std::string_view kSynced = "synced";
  }  // namespace sync_operation

  /**
   * Versions reached by the storage synchronizer operations
   */
  class SyncMetrics {
   public:
    explicit SyncMetrics(metrics::RegistryPtr registry);

    /// Sets gauge of {@param operation}, unknown operations are ignored
    void setGauge(std::string_view operation, primitives::Version version);

   private:
    metrics::RegistryPtr registry_;
    std::map<std::string, metrics::Gauge *, std::less<>> gauges_;
    log::Logger logger_;
  };

}  // namespace ledgersync::state_sync
