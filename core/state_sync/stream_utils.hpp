/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "outcome/outcome.hpp"
#include "streaming/data_notification.hpp"
#include "streaming/data_stream_listener.hpp"
#include "streaming/data_streaming_client.hpp"
#include "streaming/notification_feedback.hpp"

namespace ledgersync::state_sync {

  /**
   * Waits for the next notification of {@param active_data_stream}. Resets
   * its consecutive timeouts counter when a notification arrives.
   * @return DATA_STREAM_NOTIFICATION_TIMEOUT if nothing arrived within
   * {@param max_stream_wait_time}, CRITICAL_DATA_STREAM_TIMEOUT if that
   * happened {@param max_num_stream_timeouts} times in a row
   */
  outcome::result<streaming::DataNotification> getDataNotification(
      std::chrono::milliseconds max_stream_wait_time,
      uint64_t max_num_stream_timeouts,
      const std::shared_ptr<streaming::DataStreamListener> &active_data_stream);

  /**
   * Terminates the stream that delivered {@param notification_id}
   */
  outcome::result<void> terminateStreamWithFeedback(
      streaming::DataStreamingClient &streaming_client,
      streaming::NotificationId notification_id,
      streaming::NotificationFeedback feedback);

  /**
   * Handles notification which arrived where only the end of the stream is
   * expected. End of stream is acknowledged, any other payload is reported
   * as incorrect and results in INVALID_PAYLOAD.
   */
  outcome::result<void> handleEndOfStreamOrInvalidPayload(
      streaming::DataStreamingClient &streaming_client,
      const streaming::DataNotification &data_notification);

}  // namespace ledgersync::state_sync
