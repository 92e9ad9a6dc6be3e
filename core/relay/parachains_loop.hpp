/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/relay_task.hpp"

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "relay/clients.hpp"
#include "relay/relay_config.hpp"

namespace trestle::relay {

  /**
   * Relays heads of parachains, read at the best relay chain block known to
   * the target chain, when they differ from the heads the target keeps.
   */
  class ParachainsLoop final : public RelayTask {
   public:
    ParachainsLoop(std::string name,
                   std::shared_ptr<ParachainsSourceClient> source,
                   std::shared_ptr<ParachainsTargetClient> target,
                   std::shared_ptr<crypto::Hasher> hasher,
                   ParachainsParams params);

    const std::string &name() const override {
      return name_;
    }

    CoroOutcome<void> tick() override;

    CoroOutcome<void> reconnect() override;

   private:
    std::string name_;
    std::shared_ptr<ParachainsSourceClient> source_;
    std::shared_ptr<ParachainsTargetClient> target_;
    std::shared_ptr<crypto::Hasher> hasher_;
    ParachainsParams params_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Counter *metric_submitted_heads_;

    log::Logger logger_;
  };

}  // namespace trestle::relay
