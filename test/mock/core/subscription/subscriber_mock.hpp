/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "primitives/common.hpp"
#include "subscription/subscriber.hpp"
#include "subscription/subscription_engine.hpp"

namespace ledgersync::subscription {

  /// Object owned by subscribers in subscription engine tests
  class SubscriptionTargetMock {
   public:
    MOCK_METHOD(void,
                onVersion,
                (SubscriptionSetId, uint64_t, primitives::Version));
  };

}  // namespace ledgersync::subscription
