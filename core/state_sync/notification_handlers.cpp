/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/notification_handlers.hpp"

#include <boost/assert.hpp>

#include "state_sync/state_sync_error.hpp"
#include "state_sync/storage_utils.hpp"

namespace ledgersync::state_sync {

  namespace {
    log::Logger &logger() {
      static auto logger =
          log::createLogger("CommitNotification", "commit_notifier");
      return logger;
    }
  }  // namespace

  MempoolNotificationHandler::MempoolNotificationHandler(
      std::shared_ptr<mempool::MempoolNotificationSender> mempool_sender)
      : mempool_sender_{std::move(mempool_sender)},
        logger_{log::createLogger("MempoolNotificationHandler",
                                  "commit_notifier")} {
    BOOST_ASSERT(mempool_sender_ != nullptr);
  }

  outcome::result<void>
  MempoolNotificationHandler::notifyMempoolOfCommittedTransactions(
      const std::vector<primitives::Transaction> &committed_transactions,
      uint64_t block_timestamp_usecs) {
    std::vector<mempool::CommittedTransaction> user_transactions;
    for (auto &transaction : committed_transactions) {
      if (transaction.isUserTransaction()) {
        user_transactions.push_back(mempool::CommittedTransaction{
            .sender = transaction.sender,
            .sequence_number = transaction.sequence_number,
        });
      }
    }
    if (user_transactions.empty()) {
      return outcome::success();
    }

    auto count = user_transactions.size();
    auto res = mempool_sender_->notifyNewCommits(std::move(user_transactions),
                                                 block_timestamp_usecs);
    if (res.has_error()) {
      SL_ERROR(logger_,
               "Failed to notify mempool of {} committed transactions: {}",
               count,
               res.error().message());
      return StateSyncError::NOTIFICATION_ERROR;
    }
    return outcome::success();
  }

  outcome::result<void> CommitNotification::handleTransactionNotification(
      const std::vector<primitives::ContractEvent> &events,
      const std::vector<primitives::Transaction> &transactions,
      primitives::Version latest_synced_version,
      const primitives::LedgerInfoWithSignatures &latest_synced_ledger_info,
      MempoolNotificationHandler &mempool_notification_handler,
      events::EventSubscriptionService &event_subscription_service) {
    SL_DEBUG(logger(),
             "Notifying about {} transactions and {} events "
             "committed up to version {}",
             transactions.size(),
             events.size(),
             latest_synced_version);

    OUTCOME_TRY(mempool_notification_handler.notifyMempoolOfCommittedTransactions(
        transactions, latest_synced_ledger_info.ledger_info.timestamp_usecs));

    auto res =
        event_subscription_service.notifyEvents(latest_synced_version, events);
    if (res.has_error()) {
      SL_ERROR(logger(),
               "Failed to notify event subscribers of version {}: {}",
               latest_synced_version,
               res.error().message());
      return StateSyncError::NOTIFICATION_ERROR;
    }
    return outcome::success();
  }

  void handleCommittedTransactions(
      const CommittedTransactions &committed_transactions,
      const storage::DbReader &storage,
      MempoolNotificationHandler &mempool_notification_handler,
      events::EventSubscriptionService &event_subscription_service,
      SyncMetrics &metrics) {
    // storage is the source of truth for what is committed
    auto version_res = fetchLatestSyncedVersion(storage);
    if (version_res.has_error()) {
      SL_ERROR(logger(),
               "Skip notification about committed transactions, "
               "can't fetch the latest synced version: {}",
               version_res.error().message());
      return;
    }
    auto ledger_info_res = fetchLatestSyncedLedgerInfo(storage);
    if (ledger_info_res.has_error()) {
      SL_ERROR(logger(),
               "Skip notification about committed transactions, "
               "can't fetch the latest synced ledger info: {}",
               ledger_info_res.error().message());
      return;
    }
    auto latest_synced_version = version_res.value();

    metrics.setGauge(sync_operation::kSynced, latest_synced_version);

    auto res = CommitNotification::handleTransactionNotification(
        committed_transactions.events,
        committed_transactions.transactions,
        latest_synced_version,
        ledger_info_res.value(),
        mempool_notification_handler,
        event_subscription_service);
    if (res.has_error()) {
      SL_ERROR(logger(),
               "Failed to handle transactions committed up to version {}: {}",
               latest_synced_version,
               res.error().message());
    }
  }

  outcome::result<void> initializeSyncVersionGauges(
      const storage::DbReader &storage, SyncMetrics &metrics) {
    OUTCOME_TRY(synced_version, fetchLatestSyncedVersion(storage));
    for (auto operation : {sync_operation::kAppliedTransactionOutputs,
                           sync_operation::kExecutedTransactions,
                           sync_operation::kSynced}) {
      metrics.setGauge(operation, synced_version);
    }
    SL_DEBUG(logger(), "Sync version gauges are set to {}", synced_version);
    return outcome::success();
  }

}  // namespace ledgersync::state_sync
