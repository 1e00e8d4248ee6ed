/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "streaming/notification_feedback.hpp"

namespace ledgersync::streaming {

  std::string_view toString(NotificationFeedback feedback) {
    switch (feedback) {
      case NotificationFeedback::EmptyPayloadData:
        return "empty_payload_data";
      case NotificationFeedback::EndOfStream:
        return "end_of_stream";
      case NotificationFeedback::InvalidPayloadData:
        return "invalid_payload_data";
      case NotificationFeedback::PayloadProofFailed:
        return "payload_proof_failed";
      case NotificationFeedback::PayloadTypeIsIncorrect:
        return "payload_type_is_incorrect";
      case NotificationFeedback::StreamTimedOut:
        return "stream_timed_out";
      case NotificationFeedback::SyncStopped:
        return "sync_stopped";
    }
    return "unknown";
  }

}  // namespace ledgersync::streaming
