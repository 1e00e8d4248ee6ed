/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/driver.hpp"

#include <limits>
#include <type_traits>

#include <boost/assert.hpp>

#include "state_sync/state_sync_error.hpp"
#include "state_sync/storage_utils.hpp"
#include "state_sync/stream_utils.hpp"
#include "streaming/data_stream_error.hpp"

namespace ledgersync::state_sync {

  std::string_view toString(DriverState state) {
    switch (state) {
      case DriverState::Idle:
        return "Idle";
      case DriverState::StreamOpen:
        return "StreamOpen";
      case DriverState::Verifying:
        return "Verifying";
      case DriverState::Committing:
        return "Committing";
      case DriverState::Notifying:
        return "Notifying";
      case DriverState::Terminating:
        return "Terminating";
    }
    return "Unknown";
  }

  StateSyncDriver::StateSyncDriver(
      StateSyncDriverConfig config,
      std::shared_ptr<streaming::DataStreamingClient> streaming_client,
      std::shared_ptr<storage::DbReader> storage,
      std::shared_ptr<StorageSynchronizer> storage_synchronizer,
      std::shared_ptr<MempoolNotificationHandler> mempool_handler,
      std::shared_ptr<events::EventSubscriptionService> event_service,
      std::shared_ptr<SyncMetrics> metrics,
      std::shared_ptr<crypto::SignatureVerifier> signature_verifier)
      : config_{std::move(config)},
        streaming_client_{std::move(streaming_client)},
        storage_{std::move(storage)},
        storage_synchronizer_{std::move(storage_synchronizer)},
        mempool_handler_{std::move(mempool_handler)},
        event_service_{std::move(event_service)},
        metrics_{std::move(metrics)},
        signature_verifier_{std::move(signature_verifier)},
        logger_{log::createLogger("StateSyncDriver", "driver")} {
    BOOST_ASSERT(streaming_client_ != nullptr);
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(storage_synchronizer_ != nullptr);
    BOOST_ASSERT(mempool_handler_ != nullptr);
    BOOST_ASSERT(event_service_ != nullptr);
    BOOST_ASSERT(metrics_ != nullptr);
    BOOST_ASSERT(signature_verifier_ != nullptr);
  }

  outcome::result<void> StateSyncDriver::driveProgress() {
    if (stopped_) {
      return StateSyncError::SYNC_STOPPED;
    }
    if (not activeDataStream()) {
      OUTCOME_TRY(initializeActiveDataStream());
    }

    auto notification_res =
        getDataNotification(config_.max_stream_wait_time,
                            config_.max_num_stream_timeouts,
                            activeDataStream());
    if (stopped_) {
      return StateSyncError::SYNC_STOPPED;
    }
    if (notification_res.has_error()) {
      const auto &error = notification_res.error();
      if (error == StateSyncError::DATA_STREAM_NOTIFICATION_TIMEOUT) {
        logPendingData();
      } else if (error == StateSyncError::CRITICAL_DATA_STREAM_TIMEOUT) {
        OUTCOME_TRY(
            terminateActiveStream(streaming::NotificationFeedback::StreamTimedOut));
      } else if (error == streaming::DataStreamError::STREAM_CLOSED) {
        SL_WARN(logger_, "Data stream is closed by the streaming service");
        resetActiveStream();
        state_ = DriverState::Idle;
      }
      return error;
    }
    last_pending_log_.reset();

    return processNotification(std::move(notification_res.value()));
  }

  outcome::result<void> StateSyncDriver::run() {
    SL_INFO(logger_, "State sync driver started");

    outcome::result<void> result = outcome::success();
    while (not stopped_) {
      auto res = driveProgress();
      if (res.has_value()) {
        continue;
      }
      const auto &error = res.error();
      if (error == StateSyncError::SYNC_STOPPED) {
        break;
      }
      if (isFatal(error)) {
        SL_CRITICAL(logger_, "State sync can't proceed: {}", error.message());
        result = error;
        break;
      }
      if (error == StateSyncError::DATA_STREAM_NOTIFICATION_TIMEOUT) {
        continue;
      }
      SL_WARN(logger_, "State sync iteration failed: {}", error.message());

      std::unique_lock lock(stream_mutex_);
      stop_cv_.wait_for(lock, config_.progress_check_interval, [this] {
        return stopped_.load();
      });
    }

    auto terminate_res =
        terminateActiveStream(streaming::NotificationFeedback::SyncStopped);
    state_ = DriverState::Idle;
    SL_INFO(logger_, "State sync driver stopped");
    if (result.has_error()) {
      return result;
    }
    return terminate_res;
  }

  void StateSyncDriver::stop() {
    std::shared_ptr<streaming::DataStreamListener> stream;
    {
      std::lock_guard lock(stream_mutex_);
      stopped_ = true;
      stream = active_data_stream_;
    }
    stop_cv_.notify_all();
    if (stream) {
      stream->close();
    }
  }

  void StateSyncDriver::setSyncTarget(
      std::optional<primitives::LedgerInfoWithSignatures> target) {
    std::lock_guard lock(stream_mutex_);
    sync_target_ = std::move(target);
  }

  std::optional<primitives::Version> StateSyncDriver::syncedVersion() const {
    if (not speculative_state_) {
      return std::nullopt;
    }
    return speculative_state_->syncedVersion();
  }

  std::optional<primitives::Epoch> StateSyncDriver::trustedEpoch() const {
    if (not speculative_state_) {
      return std::nullopt;
    }
    return speculative_state_->epochState().epoch;
  }

  bool StateSyncDriver::hasActiveStream() const {
    return activeDataStream() != nullptr;
  }

  outcome::result<void> StateSyncDriver::initializeActiveDataStream() {
    OUTCOME_TRY(latest_ledger_info, fetchLatestSyncedLedgerInfo(*storage_));
    OUTCOME_TRY(synced_version, fetchLatestSyncedVersion(*storage_));
    OUTCOME_TRY(epoch_state, fetchLatestEpochState(*storage_));

    speculative_state_.emplace(
        std::move(epoch_state), std::nullopt, synced_version, signature_verifier_);
    auto start_version_res = speculative_state_->expectedNextVersion();
    if (start_version_res.has_error()) {
      speculative_state_.reset();
      return start_version_res.error();
    }
    auto start_version = start_version_res.value();

    const auto &ledger_info = latest_ledger_info.ledger_info;
    auto start_epoch = ledger_info.epoch;
    if (ledger_info.endsEpoch()) {
      if (start_epoch == std::numeric_limits<primitives::Epoch>::max()) {
        SL_ERROR(logger_, "Epoch {} has no next epoch", start_epoch);
        speculative_state_.reset();
        return StateSyncError::INTEGER_OVERFLOW;
      }
      ++start_epoch;
    }

    std::optional<primitives::LedgerInfoWithSignatures> target;
    {
      std::lock_guard lock(stream_mutex_);
      target = sync_target_;
    }

    auto stream_res =
        config_.continuous_syncing_mode
                == ContinuousSyncingMode::ApplyTransactionOutputs
            ? streaming_client_->continuouslyStreamTransactionOutputs(
                start_version, start_epoch, target)
            : streaming_client_->continuouslyStreamTransactions(
                start_version, start_epoch, false, target);
    if (stream_res.has_error()) {
      SL_WARN(logger_,
              "Failed to open data stream from version {}: {}",
              start_version,
              stream_res.error().message());
      speculative_state_.reset();
      return stream_res.error();
    }
    auto &stream = stream_res.value();
    BOOST_ASSERT(stream != nullptr);

    if (target) {
      SL_INFO(logger_,
              "Opened data stream {} from version {} in epoch {} "
              "up to version {}",
              stream->dataStreamId(),
              start_version,
              start_epoch,
              target->ledger_info.version);
    } else {
      SL_INFO(logger_,
              "Opened data stream {} from version {} in epoch {}",
              stream->dataStreamId(),
              start_version,
              start_epoch);
    }

    stream_target_ = std::move(target);
    {
      std::lock_guard lock(stream_mutex_);
      active_data_stream_ = std::move(stream);
      // stop() could not see the stream being opened
      if (stopped_) {
        active_data_stream_->close();
      }
    }
    state_ = DriverState::StreamOpen;
    return outcome::success();
  }

  outcome::result<void> StateSyncDriver::processNotification(
      streaming::DataNotification notification) {
    auto notification_id = notification.notification_id;
    return std::visit(
        [&](const auto &payload) -> outcome::result<void> {
          using Payload = std::decay_t<decltype(payload)>;
          if constexpr (std::is_same_v<
                            Payload,
                            streaming::ContinuousTransactionOutputsWithProof>) {
            if (config_.continuous_syncing_mode
                == ContinuousSyncingMode::ApplyTransactionOutputs) {
              return processTransactionOutputs(notification_id, payload);
            }
          } else if constexpr (std::is_same_v<
                                   Payload,
                                   streaming::ContinuousTransactionsWithProof>) {
            if (config_.continuous_syncing_mode
                == ContinuousSyncingMode::ExecuteTransactions) {
              return processTransactions(notification_id, payload);
            }
          }
          return handleEndOfStreamOrInvalidPayload(notification);
        },
        notification.data_payload);
  }

  outcome::result<void> StateSyncDriver::processTransactionOutputs(
      streaming::NotificationId notification_id,
      const streaming::ContinuousTransactionOutputsWithProof &payload) {
    const auto &outputs = payload.output_list_with_proof;
    return processChunk(
        notification_id,
        payload.ledger_info_with_signatures,
        outputs.first_transaction_output_version,
        outputs.size(),
        sync_operation::kAppliedTransactionOutputs,
        [&](const auto &target, const auto &end_of_epoch) {
          return storage_synchronizer_->applyTransactionOutputs(
              outputs, target, end_of_epoch);
        });
  }

  outcome::result<void> StateSyncDriver::processTransactions(
      streaming::NotificationId notification_id,
      const streaming::ContinuousTransactionsWithProof &payload) {
    const auto &transactions = payload.transaction_list_with_proof;
    return processChunk(
        notification_id,
        payload.ledger_info_with_signatures,
        transactions.first_transaction_version,
        transactions.size(),
        sync_operation::kExecutedTransactions,
        [&](const auto &target, const auto &end_of_epoch) {
          return storage_synchronizer_->executeTransactions(
              transactions, target, end_of_epoch);
        });
  }

  template <typename ApplyChunk>
  outcome::result<void> StateSyncDriver::processChunk(
      streaming::NotificationId notification_id,
      const primitives::LedgerInfoWithSignatures &ledger_info,
      const std::optional<primitives::Version> &first_version,
      size_t num_items,
      std::string_view operation,
      const ApplyChunk &apply) {
    BOOST_ASSERT(speculative_state_.has_value());
    state_ = DriverState::Verifying;

    auto proven_version = ledger_info.ledger_info.version;
    if (stream_target_
        and proven_version > stream_target_->ledger_info.version) {
      SL_WARN(logger_,
              "Notification {} proves version {} beyond the sync target {}",
              notification_id,
              proven_version,
              stream_target_->ledger_info.version);
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::InvalidPayloadData));
      return StateSyncError::INVALID_PAYLOAD;
    }

    if (auto res = speculative_state_->verifyLedgerInfoWithSignatures(
            ledger_info);
        res.has_error()) {
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::PayloadProofFailed));
      return res.error();
    }

    if (num_items == 0 or not first_version.has_value()) {
      SL_WARN(logger_, "Notification {} carries no data", notification_id);
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::EmptyPayloadData));
      return StateSyncError::INVALID_PAYLOAD;
    }

    if (num_items > config_.max_transaction_chunk_size) {
      SL_WARN(logger_,
              "Notification {} carries {} items, at most {} are allowed",
              notification_id,
              num_items,
              config_.max_transaction_chunk_size);
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::InvalidPayloadData));
      return StateSyncError::INVALID_PAYLOAD;
    }

    // Nothing can follow a synced version at the top of the version space
    auto expected_res = speculative_state_->expectedNextVersion();
    if (expected_res.has_error()) {
      SL_ERROR(logger_,
               "Notification {} cannot follow synced version {}",
               notification_id,
               speculative_state_->syncedVersion());
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::InvalidPayloadData));
      return expected_res.error();
    }
    auto expected_version = expected_res.value();
    auto start_version = first_version.value();
    if (start_version != expected_version) {
      SL_WARN(logger_,
              "Notification {} starts at version {}, expected {}",
              notification_id,
              start_version,
              expected_version);
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::InvalidPayloadData));
      return StateSyncError::INVALID_PAYLOAD;
    }

    if (proven_version < start_version
        or num_items - 1 > proven_version - start_version) {
      SL_WARN(logger_,
              "Notification {} carries {} items from version {}, "
              "but only versions up to {} are proven",
              notification_id,
              num_items,
              start_version,
              proven_version);
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::InvalidPayloadData));
      return StateSyncError::INVALID_PAYLOAD;
    }
    auto end_version = start_version + (num_items - 1);

    std::optional<primitives::LedgerInfoWithSignatures> end_of_epoch_ledger_info;
    if (ledger_info.ledger_info.endsEpoch() and end_version == proven_version) {
      end_of_epoch_ledger_info = ledger_info;
    }

    state_ = DriverState::Committing;
    auto committed_res = apply(ledger_info, end_of_epoch_ledger_info);
    if (committed_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to commit versions [{}, {}] of notification {}: {}",
               start_version,
               end_version,
               notification_id,
               committed_res.error().message());
      OUTCOME_TRY(terminateNotification(
          notification_id, streaming::NotificationFeedback::PayloadProofFailed));
      return committed_res.error();
    }

    speculative_state_->updateSyncedVersion(end_version);
    metrics_->setGauge(operation, end_version);
    SL_DEBUG(logger_,
             "Committed versions [{}, {}] proven by ledger info "
             "of epoch {} at version {}",
             start_version,
             end_version,
             ledger_info.ledger_info.epoch,
             proven_version);

    state_ = DriverState::Notifying;
    handleCommittedTransactions(committed_res.value(),
                                *storage_,
                                *mempool_handler_,
                                *event_service_,
                                *metrics_);

    state_ = DriverState::StreamOpen;
    return outcome::success();
  }

  outcome::result<void> StateSyncDriver::handleEndOfStreamOrInvalidPayload(
      const streaming::DataNotification &notification) {
    state_ = DriverState::Terminating;
    resetActiveStream();
    auto res = state_sync::handleEndOfStreamOrInvalidPayload(
        *streaming_client_, notification);
    state_ = DriverState::Idle;
    return res;
  }

  outcome::result<void> StateSyncDriver::terminateNotification(
      streaming::NotificationId notification_id,
      streaming::NotificationFeedback feedback) {
    state_ = DriverState::Terminating;
    resetActiveStream();
    auto res =
        terminateStreamWithFeedback(*streaming_client_, notification_id, feedback);
    state_ = DriverState::Idle;
    return res;
  }

  outcome::result<void> StateSyncDriver::terminateActiveStream(
      streaming::NotificationFeedback feedback) {
    auto stream = activeDataStream();
    if (not stream) {
      return outcome::success();
    }
    auto last_notification_id = stream->lastNotificationId();
    if (not last_notification_id) {
      SL_INFO(logger_,
              "Dropping data stream {} ({}), it delivered no notifications",
              stream->dataStreamId(),
              feedback);
      resetActiveStream();
      state_ = DriverState::Idle;
      return outcome::success();
    }
    return terminateNotification(*last_notification_id, feedback);
  }

  std::shared_ptr<streaming::DataStreamListener>
  StateSyncDriver::activeDataStream() const {
    std::lock_guard lock(stream_mutex_);
    return active_data_stream_;
  }

  void StateSyncDriver::resetActiveStream() {
    std::shared_ptr<streaming::DataStreamListener> stream;
    {
      std::lock_guard lock(stream_mutex_);
      stream = std::move(active_data_stream_);
      active_data_stream_.reset();
    }
    if (stream) {
      stream->close();
    }
    speculative_state_.reset();
    stream_target_.reset();
  }

  void StateSyncDriver::logPendingData() {
    auto now = std::chrono::steady_clock::now();
    if (last_pending_log_
        and now - *last_pending_log_ < config_.pending_data_log_interval) {
      return;
    }
    last_pending_log_ = now;
    SL_INFO(logger_,
            "Waiting for data from the network, synced version is {}",
            speculative_state_ ? speculative_state_->syncedVersion() : 0);
  }

}  // namespace ledgersync::state_sync
