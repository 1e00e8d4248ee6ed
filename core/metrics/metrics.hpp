/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "metrics/registry.hpp"

namespace ledgersync::metrics {
  using RegistryPtr = std::unique_ptr<Registry>;

  // the function recommended to use to create a registry of the chosen
  // implementation
  RegistryPtr createRegistry();

  /**
   * @brief A counter metric to represent a monotonically increasing value.
   *
   * This class represents the metric type counter:
   * https://prometheus.io/docs/concepts/metric_types/#counter
   */
  class Counter {
   public:
    virtual ~Counter() = default;

    /**
     * @brief Increment the counter by 1.
     */
    virtual void inc() = 0;

    /**
     * The counter will not change if the given amount is negative.
     */
    virtual void inc(double val) = 0;
  };

  /**
   * @brief A gauge metric to represent a value that can arbitrarily go up and
   * down.
   *
   * The class represents the metric type gauge:
   * https://prometheus.io/docs/concepts/metric_types/#gauge
   */
  class Gauge {
   public:
    virtual ~Gauge() = default;

    virtual void inc() = 0;

    virtual void inc(double val) = 0;

    virtual void dec() = 0;

    virtual void dec(double val) = 0;

    /**
     * @brief Set the gauge to the given value.
     */
    virtual void set(double val) = 0;
  };
}  // namespace ledgersync::metrics
