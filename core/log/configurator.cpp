/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

namespace ledgersync::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: libp2p
        level: off
      - name: ledgersync
        children:
          - name: application
          - name: crypto
          - name: metrics
          - name: streaming
          - name: storage
          - name: mempool
          - name: events
          - name: state_sync
            children:
              - name: driver
              - name: speculative_state
              - name: commit_notifier
      - name: others
        children:
          - name: testing
          - name: debug
# ----------------
  )");
  }  // namespace

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : ConfiguratorFromYAML(std::move(previous), embedded_config) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::string config)
      : ConfiguratorFromYAML(std::move(previous), std::move(config)) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(previous), std::move(path)) {}

}  // namespace ledgersync::log
