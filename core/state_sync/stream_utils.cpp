/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_sync/stream_utils.hpp"

#include <boost/assert.hpp>

#include "log/logger.hpp"
#include "state_sync/state_sync_error.hpp"
#include "streaming/data_stream_error.hpp"

namespace ledgersync::state_sync {

  namespace {
    log::Logger &logger() {
      static auto logger = log::createLogger("StreamUtils", "state_sync");
      return logger;
    }
  }  // namespace

  outcome::result<streaming::DataNotification> getDataNotification(
      std::chrono::milliseconds max_stream_wait_time,
      uint64_t max_num_stream_timeouts,
      const std::shared_ptr<streaming::DataStreamListener>
          &active_data_stream) {
    BOOST_ASSERT_MSG(active_data_stream != nullptr,
                     "Data stream must be open before fetching");

    auto res = active_data_stream->next(max_stream_wait_time);
    if (res.has_value()) {
      active_data_stream->resetConsecutiveTimeouts();
      return res;
    }

    if (res.error() != streaming::DataStreamError::TIMEOUT) {
      return res.error();
    }

    auto num_timeouts = active_data_stream->incrementConsecutiveTimeouts();
    SL_DEBUG(logger(),
             "No notification from data stream {} in {} ms "
             "({} consecutive timeouts)",
             active_data_stream->dataStreamId(),
             max_stream_wait_time.count(),
             num_timeouts);
    if (num_timeouts >= max_num_stream_timeouts) {
      SL_WARN(logger(),
              "Data stream {} timed out {} times in a row",
              active_data_stream->dataStreamId(),
              num_timeouts);
      return StateSyncError::CRITICAL_DATA_STREAM_TIMEOUT;
    }
    return StateSyncError::DATA_STREAM_NOTIFICATION_TIMEOUT;
  }

  outcome::result<void> terminateStreamWithFeedback(
      streaming::DataStreamingClient &streaming_client,
      streaming::NotificationId notification_id,
      streaming::NotificationFeedback feedback) {
    SL_INFO(logger(),
            "Terminating the data stream with feedback {} for "
            "notification {}",
            feedback,
            notification_id);
    auto res =
        streaming_client.terminateStreamWithFeedback(notification_id, feedback);
    if (res.has_error()) {
      SL_ERROR(logger(),
               "Failed to terminate the data stream of notification {}: {}",
               notification_id,
               res.error().message());
    }
    return res;
  }

  outcome::result<void> handleEndOfStreamOrInvalidPayload(
      streaming::DataStreamingClient &streaming_client,
      const streaming::DataNotification &data_notification) {
    if (std::holds_alternative<streaming::EndOfStream>(
            data_notification.data_payload)) {
      return terminateStreamWithFeedback(
          streaming_client,
          data_notification.notification_id,
          streaming::NotificationFeedback::EndOfStream);
    }

    SL_WARN(logger(),
            "Notification {} carries a payload of unexpected type",
            data_notification.notification_id);
    OUTCOME_TRY(terminateStreamWithFeedback(
        streaming_client,
        data_notification.notification_id,
        streaming::NotificationFeedback::PayloadTypeIsIncorrect));
    return StateSyncError::INVALID_PAYLOAD;
  }

}  // namespace ledgersync::state_sync
