/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "crypto/signature_verifier.hpp"
#include "events/event_subscription_service.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "state_sync/notification_handlers.hpp"
#include "state_sync/speculative_stream_state.hpp"
#include "state_sync/state_sync_config.hpp"
#include "state_sync/storage_synchronizer.hpp"
#include "state_sync/sync_metrics.hpp"
#include "storage/db_reader.hpp"
#include "streaming/data_streaming_client.hpp"

namespace ledgersync::state_sync {

  enum class DriverState {
    Idle,
    StreamOpen,
    Verifying,
    Committing,
    Notifying,
    Terminating,
  };

  std::string_view toString(DriverState state);

  /**
   * Keeps the local ledger in sync with the network. Consumes one data
   * stream at a time: every notification is verified against the trusted
   * epoch state, committed by the storage synchronizer and announced to
   * mempool and event subscribers before the next one is fetched. A stream
   * which delivers bad data, ends or goes silent is terminated, and the
   * next one starts from the state read back from storage.
   *
   * All methods but `stop` and `state` are called from the single driver
   * task.
   */
  class StateSyncDriver {
   public:
    StateSyncDriver(
        StateSyncDriverConfig config,
        std::shared_ptr<streaming::DataStreamingClient> streaming_client,
        std::shared_ptr<storage::DbReader> storage,
        std::shared_ptr<StorageSynchronizer> storage_synchronizer,
        std::shared_ptr<MempoolNotificationHandler> mempool_handler,
        std::shared_ptr<events::EventSubscriptionService> event_service,
        std::shared_ptr<SyncMetrics> metrics,
        std::shared_ptr<crypto::SignatureVerifier> signature_verifier);

    /**
     * Opens a data stream if there is no active one, then fetches and
     * processes exactly one notification
     */
    outcome::result<void> driveProgress();

    /**
     * Drives progress until stopped or until a fatal error. The active
     * stream is terminated with SyncStopped feedback on stop.
     */
    outcome::result<void> run();

    /// Requests `run` to return, wakes up a pending fetch
    void stop();

    /// Bounds streams opened from now on by {@param target}
    void setSyncTarget(
        std::optional<primitives::LedgerInfoWithSignatures> target);

    DriverState state() const {
      return state_.load();
    }

    /// Version synced by the active stream
    std::optional<primitives::Version> syncedVersion() const;

    /// Epoch of the validators trusted by the active stream
    std::optional<primitives::Epoch> trustedEpoch() const;

    bool hasActiveStream() const;

   private:
    outcome::result<void> initializeActiveDataStream();

    outcome::result<void> processNotification(
        streaming::DataNotification notification);

    outcome::result<void> processTransactionOutputs(
        streaming::NotificationId notification_id,
        const streaming::ContinuousTransactionOutputsWithProof &payload);

    outcome::result<void> processTransactions(
        streaming::NotificationId notification_id,
        const streaming::ContinuousTransactionsWithProof &payload);

    /**
     * Common part of processing both kinds of data. Chunk is verified and
     * then applied with {@param apply}.
     */
    template <typename ApplyChunk>
    outcome::result<void> processChunk(
        streaming::NotificationId notification_id,
        const primitives::LedgerInfoWithSignatures &ledger_info,
        const std::optional<primitives::Version> &first_version,
        size_t num_items,
        std::string_view operation,
        const ApplyChunk &apply);

    outcome::result<void> handleEndOfStreamOrInvalidPayload(
        const streaming::DataNotification &notification);

    /// Terminates the active stream by the notification it delivered
    outcome::result<void> terminateNotification(
        streaming::NotificationId notification_id,
        streaming::NotificationFeedback feedback);

    /**
     * Terminates the active stream by the last notification it delivered,
     * or drops it silently if it delivered nothing
     */
    outcome::result<void> terminateActiveStream(
        streaming::NotificationFeedback feedback);

    std::shared_ptr<streaming::DataStreamListener> activeDataStream() const;

    void resetActiveStream();

    void logPendingData();

    const StateSyncDriverConfig config_;
    std::shared_ptr<streaming::DataStreamingClient> streaming_client_;
    std::shared_ptr<storage::DbReader> storage_;
    std::shared_ptr<StorageSynchronizer> storage_synchronizer_;
    std::shared_ptr<MempoolNotificationHandler> mempool_handler_;
    std::shared_ptr<events::EventSubscriptionService> event_service_;
    std::shared_ptr<SyncMetrics> metrics_;
    std::shared_ptr<crypto::SignatureVerifier> signature_verifier_;

    std::atomic<DriverState> state_{DriverState::Idle};
    std::atomic_bool stopped_{false};

    mutable std::mutex stream_mutex_;
    std::condition_variable stop_cv_;
    std::shared_ptr<streaming::DataStreamListener> active_data_stream_;
    std::optional<primitives::LedgerInfoWithSignatures> sync_target_;

    std::optional<SpeculativeStreamState> speculative_state_;
    /// Target the active stream was opened with
    std::optional<primitives::LedgerInfoWithSignatures> stream_target_;
    std::optional<std::chrono::steady_clock::time_point> last_pending_log_;

    log::Logger logger_;
  };

}  // namespace ledgersync::state_sync
