/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/metrics_impl.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>

namespace ledgersync::metrics {

  PrometheusCounter::PrometheusCounter(prometheus::Counter &c) : c_(c) {}

  void PrometheusCounter::inc() {
    c_.Increment();
  }

  void PrometheusCounter::inc(double val) {
    c_.Increment(val);
  }

  PrometheusGauge::PrometheusGauge(prometheus::Gauge &g) : g_(g) {}

  void PrometheusGauge::inc() {
    g_.Increment();
  }

  void PrometheusGauge::inc(double val) {
    g_.Increment(val);
  }

  void PrometheusGauge::dec() {
    g_.Decrement();
  }

  void PrometheusGauge::dec(double val) {
    g_.Decrement(val);
  }

  void PrometheusGauge::set(double val) {
    g_.Set(val);
  }

}  // namespace ledgersync::metrics
