/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/relay_task.hpp"

#include "consensus/grandpa/justification_verifier.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "relay/clients.hpp"
#include "relay/relay_config.hpp"

namespace trestle::relay {

  /**
   * Relays finalized headers of the source chain to the header chain module
   * of the target chain. A header changing the authority set is submitted
   * before any header after it, otherwise the best header with a
   * justification is chosen. The justification is optimized against the
   * authority set known to the target before submission.
   */
  class FinalityLoop final : public RelayTask {
   public:
    FinalityLoop(std::string name,
                 std::shared_ptr<FinalitySourceClient> source,
                 std::shared_ptr<FinalityTargetClient> target,
                 std::shared_ptr<consensus::grandpa::JustificationVerifier>
                     verifier,
                 std::shared_ptr<crypto::Hasher> hasher,
                 RelayTimings timings);

    const std::string &name() const override {
      return name_;
    }

    CoroOutcome<void> tick() override;

    CoroOutcome<void> reconnect() override;

   private:
    struct Submitted {
      BlockNumber number;
      std::chrono::steady_clock::time_point at;
    };

    struct Selected {
      BlockHeader header;
      GrandpaJustification justification;
      bool is_mandatory;
    };

    /// Next header to submit from [first, last]
    CoroOutcome<std::optional<Selected>> selectHeader(BlockNumber first,
                                                      BlockNumber last);

    std::string name_;
    std::shared_ptr<FinalitySourceClient> source_;
    std::shared_ptr<FinalityTargetClient> target_;
    std::shared_ptr<consensus::grandpa::JustificationVerifier> verifier_;
    std::shared_ptr<crypto::Hasher> hasher_;
    RelayTimings timings_;

    std::optional<Submitted> submitted_;
    /// Source headers up to this one have nothing to submit
    BlockNumber scanned_up_to_ = 0;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Gauge *metric_best_source_at_target_;
    metrics::Counter *metric_submitted_headers_;
    metrics::Counter *metric_stalls_;

    log::Logger logger_;
  };

}  // namespace trestle::relay
