/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "events/event_subscription_service.hpp"
#include "log/logger.hpp"
#include "mempool/mempool_notification_sender.hpp"
#include "outcome/outcome.hpp"
#include "primitives/ledger_info.hpp"
#include "primitives/transaction.hpp"
#include "state_sync/storage_synchronizer.hpp"
#include "state_sync/sync_metrics.hpp"
#include "storage/db_reader.hpp"

namespace ledgersync::state_sync {

  /**
   * Forwards committed user transactions to mempool
   */
  class MempoolNotificationHandler {
   public:
    explicit MempoolNotificationHandler(
        std::shared_ptr<mempool::MempoolNotificationSender> mempool_sender);

    /**
     * Sends sender and sequence number of each user transaction. Nothing is
     * sent if there are no user transactions.
     * @return NOTIFICATION_ERROR if mempool can't be notified
     */
    outcome::result<void> notifyMempoolOfCommittedTransactions(
        const std::vector<primitives::Transaction> &committed_transactions,
        uint64_t block_timestamp_usecs);

   private:
    std::shared_ptr<mempool::MempoolNotificationSender> mempool_sender_;
    log::Logger logger_;
  };

  class CommitNotification {
   public:
    /**
     * Notifies mempool and then the event service about data committed up
     * to {@param latest_synced_version}. Stops at the first failure.
     */
    static outcome::result<void> handleTransactionNotification(
        const std::vector<primitives::ContractEvent> &events,
        const std::vector<primitives::Transaction> &transactions,
        primitives::Version latest_synced_version,
        const primitives::LedgerInfoWithSignatures &latest_synced_ledger_info,
        MempoolNotificationHandler &mempool_notification_handler,
        events::EventSubscriptionService &event_subscription_service);
  };

  /**
   * Notifies downstream consumers about {@param committed_transactions}
   * using the latest version and ledger info read back from storage.
   * Failures are logged and never block syncing.
   */
  void handleCommittedTransactions(
      const CommittedTransactions &committed_transactions,
      const storage::DbReader &storage,
      MempoolNotificationHandler &mempool_notification_handler,
      events::EventSubscriptionService &event_subscription_service,
      SyncMetrics &metrics);

  /// Sets all storage synchronizer gauges to the latest synced version
  outcome::result<void> initializeSyncVersionGauges(
      const storage::DbReader &storage, SyncMetrics &metrics);

}  // namespace ledgersync::state_sync
