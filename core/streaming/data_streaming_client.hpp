/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "outcome/outcome.hpp"
#include "primitives/ledger_info.hpp"
#include "streaming/data_notification.hpp"
#include "streaming/data_stream_listener.hpp"
#include "streaming/notification_feedback.hpp"

namespace ledgersync::streaming {

  /**
   * Client of the data streaming service which fetches ledger data from
   * peers
   */
  class DataStreamingClient {
   public:
    virtual ~DataStreamingClient() = default;

    /**
     * Opens a stream of transaction outputs with proofs starting at
     * {@param start_version}. Without {@param target} the stream follows the
     * head of the network.
     */
    virtual outcome::result<std::shared_ptr<DataStreamListener>>
    continuouslyStreamTransactionOutputs(
        primitives::Version start_version,
        primitives::Epoch start_epoch,
        const std::optional<primitives::LedgerInfoWithSignatures> &target) = 0;

    /**
     * Opens a stream of transactions with proofs starting at
     * {@param start_version}, optionally with their events
     */
    virtual outcome::result<std::shared_ptr<DataStreamListener>>
    continuouslyStreamTransactions(
        primitives::Version start_version,
        primitives::Epoch start_epoch,
        bool include_events,
        const std::optional<primitives::LedgerInfoWithSignatures> &target) = 0;

    /**
     * Terminates the stream which delivered {@param notification_id} and
     * reports {@param feedback} about it
     */
    virtual outcome::result<void> terminateStreamWithFeedback(
        NotificationId notification_id, NotificationFeedback feedback) = 0;
  };

}  // namespace ledgersync::streaming
