/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <fmt/format.h>

namespace ledgersync::streaming {

  /// Reason for terminating a data stream, reported to the streaming service
  enum class NotificationFeedback {
    EmptyPayloadData,
    EndOfStream,
    InvalidPayloadData,
    PayloadProofFailed,
    PayloadTypeIsIncorrect,
    StreamTimedOut,
    SyncStopped,
  };

  std::string_view toString(NotificationFeedback feedback);

}  // namespace ledgersync::streaming

template <>
struct fmt::formatter<ledgersync::streaming::NotificationFeedback>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ledgersync::streaming::NotificationFeedback &feedback,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        ledgersync::streaming::toString(feedback), ctx);
  }
};
