/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

namespace prometheus {
  class Counter;
  class Gauge;
}  // namespace prometheus

namespace ledgersync::metrics {

  class PrometheusCounter : public Counter {
    friend class PrometheusRegistry;
    prometheus::Counter &c_;

   public:
    explicit PrometheusCounter(prometheus::Counter &c);

    void inc() override;
    void inc(double val) override;
  };

  class PrometheusGauge : public Gauge {
    friend class PrometheusRegistry;
    prometheus::Gauge &g_;

   public:
    explicit PrometheusGauge(prometheus::Gauge &g);

    void inc() override;
    void inc(double val) override;
    void dec() override;
    void dec(double val) override;
    void set(double val) override;
  };

}  // namespace ledgersync::metrics
