/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/sync_metrics.hpp"

#include <boost/assert.hpp>

#include "metrics/registry.hpp"

namespace {
  constexpr auto kStorageSynchronizerOperations =
      "ledgersync_state_sync_storage_synchronizer_operations";
}  // namespace

namespace ledgersync::state_sync {

  SyncMetrics::SyncMetrics(metrics::RegistryPtr registry)
      : registry_{std::move(registry)},
        logger_{log::createLogger("SyncMetrics", "metrics")} {
    BOOST_ASSERT(registry_ != nullptr);

    registry_->registerGaugeFamily(
        kStorageSynchronizerOperations,
        "Latest versions reached by the storage synchronizer operations");
    for (auto operation : {sync_operation::kAppliedTransactionOutputs,
                           sync_operation::kExecutedTransactions,
                           sync_operation::kSynced}) {
      std::string label{operation};
      auto gauge = registry_->registerGaugeMetric(
          kStorageSynchronizerOperations, {{"operation", label}});
      if (gauge == nullptr) {
        SL_WARN(logger_, "Can't register gauge of operation {}", operation);
        continue;
      }
      gauges_.emplace(std::move(label), gauge);
    }
  }

  void SyncMetrics::setGauge(std::string_view operation,
                             primitives::Version version) {
    auto it = gauges_.find(operation);
    if (it == gauges_.end()) {
      SL_TRACE(logger_, "No gauge for operation {}", operation);
      return;
    }
    // versions above 2^53 lose precision in the double typed gauge
    it->second->set(static_cast<double>(version));
  }

}  // namespace ledgersync::state_sync
