/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

namespace ledgersync::metrics {

  RegistryPtr createRegistry() {
    return std::make_unique<PrometheusRegistry>();
  }

  PrometheusRegistry::PrometheusRegistry()
      : registry_{std::make_shared<prometheus::Registry>()} {}

  prometheus::Counter *PrometheusRegistry::internalMetric(Counter *metric) {
    if (auto counter = dynamic_cast<PrometheusCounter *>(metric)) {
      return &counter->c_;
    }
    return nullptr;
  }

  prometheus::Gauge *PrometheusRegistry::internalMetric(Gauge *metric) {
    if (auto gauge = dynamic_cast<PrometheusGauge *>(metric)) {
      return &gauge->g_;
    }
    return nullptr;
  }

  std::shared_ptr<prometheus::Registry> PrometheusRegistry::collectable()
      const {
    return registry_;
  }

  void PrometheusRegistry::registerCounterFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock(mutex_);
    if (counter_families_.contains(name)) {
      return;
    }
    auto &family = prometheus::BuildCounter()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    counter_families_.emplace(name, &family);
  }

  void PrometheusRegistry::registerGaugeFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock(mutex_);
    if (gauge_families_.contains(name)) {
      return;
    }
    auto &family = prometheus::BuildGauge()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    gauge_families_.emplace(name, &family);
  }

  Counter *PrometheusRegistry::registerCounterMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock(mutex_);
    auto it = counter_families_.find(name);
    if (it == counter_families_.end()) {
      return nullptr;
    }
    auto &counter = counters_.emplace_back(
        std::make_unique<PrometheusCounter>(it->second->Add(labels)));
    return counter.get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock(mutex_);
    auto it = gauge_families_.find(name);
    if (it == gauge_families_.end()) {
      return nullptr;
    }
    auto &gauge = gauges_.emplace_back(
        std::make_unique<PrometheusGauge>(it->second->Add(labels)));
    return gauge.get();
  }

}  // namespace ledgersync::metrics
