/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"
#include "metrics/registry.hpp"

#include <gmock/gmock.h>

namespace ledgersync::metrics {

  using Labels = std::map<std::string, std::string>;

  class RegistryMock : public Registry {
   public:
    MOCK_METHOD(void,
                registerCounterFamily,
                (const std::string &, const std::string &, const Labels &),
                (override));

    MOCK_METHOD(void,
                registerGaugeFamily,
                (const std::string &, const std::string &, const Labels &),
                (override));

    MOCK_METHOD(Counter *,
                registerCounterMetric,
                (const std::string &, const Labels &),
                (override));

    MOCK_METHOD(Gauge *,
                registerGaugeMetric,
                (const std::string &, const Labels &),
                (override));
  };

  class GaugeMock : public Gauge {
   public:
    MOCK_METHOD(void, inc, (), (override));
    MOCK_METHOD(void, inc, (double), (override));
    MOCK_METHOD(void, dec, (), (override));
    MOCK_METHOD(void, dec, (double), (override));
    MOCK_METHOD(void, set, (double), (override));
  };

}  // namespace ledgersync::metrics
