/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "outcome/outcome.hpp"
#include "streaming/data_notification.hpp"

namespace ledgersync::streaming {

  /**
   * Receiving end of a data stream. The streaming service pushes
   * notifications, the state sync driver pulls them with a bounded wait.
   */
  class DataStreamListener {
   public:
    explicit DataStreamListener(DataStreamId data_stream_id);

    DataStreamId dataStreamId() const {
      return data_stream_id_;
    }

    /// Enqueues notification, ignored once the stream is closed
    void pushNotification(DataNotification notification);

    /// Closes the stream and wakes up a pending `next` call
    void close();

    bool isClosed() const;

    /**
     * Waits up to {@param timeout} for the next notification
     * @return TIMEOUT if nothing arrived in time, STREAM_CLOSED if the stream
     * is closed and drained
     */
    outcome::result<DataNotification> next(std::chrono::milliseconds timeout);

    /// Id of the last notification returned by `next`
    std::optional<NotificationId> lastNotificationId() const;

    uint64_t numConsecutiveTimeouts() const;

    /// @return counter value after the increment
    uint64_t incrementConsecutiveTimeouts();

    void resetConsecutiveTimeouts();

   private:
    const DataStreamId data_stream_id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DataNotification> notifications_;
    bool closed_ = false;
    std::optional<NotificationId> last_notification_id_;
    uint64_t num_consecutive_timeouts_ = 0;
  };

}  // namespace ledgersync::streaming
