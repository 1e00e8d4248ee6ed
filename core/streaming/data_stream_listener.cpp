/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "streaming/data_stream_listener.hpp"

#include "streaming/data_stream_error.hpp"

namespace ledgersync::streaming {

  DataStreamListener::DataStreamListener(DataStreamId data_stream_id)
      : data_stream_id_{data_stream_id} {}

  void DataStreamListener::pushNotification(DataNotification notification) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return;
      }
      notifications_.emplace_back(std::move(notification));
    }
    cv_.notify_one();
  }

  void DataStreamListener::close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool DataStreamListener::isClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  outcome::result<DataNotification> DataStreamListener::next(
      std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] {
      return closed_ or not notifications_.empty();
    });
    if (not notifications_.empty()) {
      auto notification = std::move(notifications_.front());
      notifications_.pop_front();
      last_notification_id_ = notification.notification_id;
      return notification;
    }
    if (closed_) {
      return DataStreamError::STREAM_CLOSED;
    }
    return DataStreamError::TIMEOUT;
  }

  std::optional<NotificationId> DataStreamListener::lastNotificationId()
      const {
    std::lock_guard lock(mutex_);
    return last_notification_id_;
  }

  uint64_t DataStreamListener::numConsecutiveTimeouts() const {
    std::lock_guard lock(mutex_);
    return num_consecutive_timeouts_;
  }

  uint64_t DataStreamListener::incrementConsecutiveTimeouts() {
    std::lock_guard lock(mutex_);
    return ++num_consecutive_timeouts_;
  }

  void DataStreamListener::resetConsecutiveTimeouts() {
    std::lock_guard lock(mutex_);
    num_consecutive_timeouts_ = 0;
  }

}  // namespace ledgersync::streaming
