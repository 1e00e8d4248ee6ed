/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "streaming/data_streaming_client.hpp"

#include <gmock/gmock.h>

namespace ledgersync::streaming {

  class DataStreamingClientMock : public DataStreamingClient {
   public:
    MOCK_METHOD(outcome::result<std::shared_ptr<DataStreamListener>>,
                continuouslyStreamTransactionOutputs,
                (primitives::Version,
                 primitives::Epoch,
                 const std::optional<primitives::LedgerInfoWithSignatures> &),
                (override));

    MOCK_METHOD(outcome::result<std::shared_ptr<DataStreamListener>>,
                continuouslyStreamTransactions,
                (primitives::Version,
                 primitives::Epoch,
                 bool,
                 const std::optional<primitives::LedgerInfoWithSignatures> &),
                (override));

    MOCK_METHOD(outcome::result<void>,
                terminateStreamWithFeedback,
                (NotificationId, NotificationFeedback),
                (override));
  };

}  // namespace ledgersync::streaming
