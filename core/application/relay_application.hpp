/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/relay_engine.hpp"

namespace trestle::application {

  /**
   * @class RelayApplication relay process interface
   */
  class RelayApplication {
   public:
    virtual ~RelayApplication() = default;

    /// Requests graceful shutdown from any thread
    virtual void shutdown() = 0;

    /// Runs relay tasks until shutdown or the fatal outcome
    virtual relay::RelayEngine::ExitStatus run() = 0;
  };

}  // namespace trestle::application
