/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <soralog/impl/configurator_from_yaml.hpp>

namespace trestle::log {

  /**
   * Applies the embedded group tree of the relay on top of `previous`
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator();

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);
  };

}  // namespace trestle::log
