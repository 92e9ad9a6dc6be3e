/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "coro/coro.hpp"

namespace trestle::relay {

  /**
   * One logical direction of the relay. A tick polls both chains, decides
   * the next unit of work and submits it. Units are derived from the chain
   * state, so a failed tick retried later picks the same unit again.
   */
  class RelayTask {
   public:
    virtual ~RelayTask() = default;

    virtual const std::string &name() const = 0;

    virtual CoroOutcome<void> tick() = 0;

    /// Reconnects clients of the task after a connection error
    virtual CoroOutcome<void> reconnect() = 0;
  };

}  // namespace trestle::relay
