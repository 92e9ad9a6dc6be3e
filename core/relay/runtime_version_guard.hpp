/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/relay_task.hpp"

#include "log/logger.hpp"
#include "relay/clients.hpp"
#include "relay/relay_config.hpp"
#include "relay/relay_context.hpp"

namespace trestle::relay {

  /**
   * Stops the whole relay when the runtime of the target chain changes.
   * Calls encoded for the old runtime may be misinterpreted by the new one.
   */
  class RuntimeVersionGuard final : public RelayTask {
   public:
    RuntimeVersionGuard(std::string name,
                        std::shared_ptr<RuntimeVersionClient> client,
                        std::shared_ptr<RelayContext> context,
                        RuntimeGuardParams params);

    const std::string &name() const override {
      return name_;
    }

    CoroOutcome<void> tick() override;

    CoroOutcome<void> reconnect() override;

   private:
    std::string name_;
    std::shared_ptr<RuntimeVersionClient> client_;
    std::shared_ptr<RelayContext> context_;
    RuntimeGuardParams params_;
    std::optional<primitives::RuntimeVersion> first_seen_;
    log::Logger logger_;
  };

}  // namespace trestle::relay
