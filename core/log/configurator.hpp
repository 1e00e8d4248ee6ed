/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace ledgersync::log {

  /**
   * Configures logging system with the embedded group tree of ledgersync.
   * Configuration of previous configurator is applied first.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::filesystem::path path);
  };

}  // namespace ledgersync::log
