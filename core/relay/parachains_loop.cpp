/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/parachains_loop.hpp"

#include "metrics/registry.hpp"

namespace {
  constexpr auto kSubmittedHeads = "trestle_relay_submitted_para_heads_total";
}

namespace trestle::relay {

  ParachainsLoop::ParachainsLoop(
      std::string name,
      std::shared_ptr<ParachainsSourceClient> source,
      std::shared_ptr<ParachainsTargetClient> target,
      std::shared_ptr<crypto::Hasher> hasher,
      ParachainsParams params)
      : name_{std::move(name)},
        source_{std::move(source)},
        target_{std::move(target)},
        hasher_{std::move(hasher)},
        params_{std::move(params)},
        logger_{log::createLogger("ParachainsLoop", "parachains_relay")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(target_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);

    metrics_registry_->registerCounterFamily(
        kSubmittedHeads, "Number of parachain heads submitted to the target");
    metric_submitted_heads_ = metrics_registry_->registerCounterMetric(
        kSubmittedHeads, {{"task", name_}});
  }

  CoroOutcome<void> ParachainsLoop::reconnect() {
    CO_TRY(co_await source_->reconnect());
    CO_TRY(co_await target_->reconnect());
    co_return outcome::success();
  }

  CoroOutcome<void> ParachainsLoop::tick() {
    auto relay_at_target = CO_TRY(co_await target_->bestFinalizedSourceBlock());

    std::vector<bridge::parachains::ParaId> para_ids;
    std::vector<bridge::parachains::ParaHeadUpdate> updates;
    for (auto para_id : params_.para_ids) {
      auto head =
          CO_TRY(co_await source_->paraHead(para_id, relay_at_target.hash));
      if (not head) {
        SL_TRACE(logger_,
                 "[{}] Parachain {} has no head at {}",
                 name_,
                 para_id,
                 relay_at_target);
        continue;
      }
      auto head_hash = hasher_->blake2b_256(*head);
      auto stored = CO_TRY(co_await target_->bestParaHeadHash(para_id));
      if (stored
          and (stored->head_hash == head_hash
               or stored->at_relay_block_number >= relay_at_target.number)) {
        continue;
      }
      para_ids.emplace_back(para_id);
      updates.emplace_back(bridge::parachains::ParaHeadUpdate{
          .para_id = para_id,
          .head_hash = head_hash,
      });
    }
    if (updates.empty()) {
      co_return outcome::success();
    }

    auto proof = CO_TRY(
        co_await source_->proveParaHeads(para_ids, relay_at_target.hash));
    auto count = updates.size();
    CO_TRY(co_await target_->submitParachainHeads(
        relay_at_target, std::move(updates), std::move(proof)));
    metric_submitted_heads_->inc(static_cast<double>(count));
    SL_INFO(logger_,
            "[{}] Submitted {} parachain heads at relay block {}",
            name_,
            count,
            relay_at_target);
    co_return outcome::success();
  }

}  // namespace trestle::relay
