/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace ledgersync::metrics {

  class PrometheusRegistry : public Registry {
   public:
    PrometheusRegistry();
    ~PrometheusRegistry() override = default;

    /// for tests and exposers: access to the underlying metric
    static prometheus::Counter *internalMetric(Counter *metric);
    static prometheus::Gauge *internalMetric(Gauge *metric);

    /// collectable to be served by an exposer
    std::shared_ptr<prometheus::Registry> collectable() const;

    void registerCounterFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerGaugeFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    Counter *registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Gauge *registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

   private:
    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex mutex_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Counter> *>
        counter_families_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Gauge> *>
        gauge_families_;
    std::vector<std::unique_ptr<PrometheusCounter>> counters_;
    std::vector<std::unique_ptr<PrometheusGauge>> gauges_;
  };

}  // namespace ledgersync::metrics
