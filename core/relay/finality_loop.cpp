/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/finality_loop.hpp"

#include <algorithm>

#include "metrics/registry.hpp"
#include "primitives/scheduled_change.hpp"
#include "scale/trestle_scale.hpp"

namespace {
  constexpr auto kBestSourceAtTarget =
      "trestle_relay_best_source_block_at_target";
  constexpr auto kSubmittedHeaders = "trestle_relay_submitted_headers_total";
  constexpr auto kStalls = "trestle_relay_finality_stalls_total";
}  // namespace

namespace trestle::relay {

  FinalityLoop::FinalityLoop(
      std::string name,
      std::shared_ptr<FinalitySourceClient> source,
      std::shared_ptr<FinalityTargetClient> target,
      std::shared_ptr<consensus::grandpa::JustificationVerifier> verifier,
      std::shared_ptr<crypto::Hasher> hasher,
      RelayTimings timings)
      : name_{std::move(name)},
        source_{std::move(source)},
        target_{std::move(target)},
        verifier_{std::move(verifier)},
        hasher_{std::move(hasher)},
        timings_{timings},
        logger_{log::createLogger("FinalityLoop", "finality_relay")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(target_ != nullptr);
    BOOST_ASSERT(verifier_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);

    metrics_registry_->registerGaugeFamily(
        kBestSourceAtTarget,
        "Best finalized source block imported by the target chain");
    metric_best_source_at_target_ = metrics_registry_->registerGaugeMetric(
        kBestSourceAtTarget, {{"task", name_}});
    metrics_registry_->registerCounterFamily(
        kSubmittedHeaders, "Number of finality proofs submitted to the target");
    metric_submitted_headers_ = metrics_registry_->registerCounterMetric(
        kSubmittedHeaders, {{"task", name_}});
    metrics_registry_->registerCounterFamily(
        kStalls, "Number of submitted headers not imported in time");
    metric_stalls_ =
        metrics_registry_->registerCounterMetric(kStalls, {{"task", name_}});
  }

  CoroOutcome<void> FinalityLoop::reconnect() {
    CO_TRY(co_await source_->reconnect());
    CO_TRY(co_await target_->reconnect());
    co_return outcome::success();
  }

  CoroOutcome<void> FinalityLoop::tick() {
    auto best_at_source = CO_TRY(co_await source_->bestFinalizedBlockNumber());
    auto best_at_target = CO_TRY(co_await target_->bestFinalizedSourceBlock());
    metric_best_source_at_target_->set(best_at_target.number);

    if (submitted_) {
      if (submitted_->number <= best_at_target.number) {
        SL_DEBUG(logger_,
                 "[{}] Header #{} is imported by the target",
                 name_,
                 submitted_->number);
        submitted_.reset();
      } else if (std::chrono::steady_clock::now() - submitted_->at
                 < timings_.stall_timeout) {
        co_return outcome::success();
      } else {
        SL_WARN(logger_,
                "[{}] Header #{} is not imported in time, resubmitting",
                name_,
                submitted_->number);
        metric_stalls_->inc();
        submitted_.reset();
      }
    }

    scanned_up_to_ = std::max(scanned_up_to_, best_at_target.number);
    if (scanned_up_to_ >= best_at_source) {
      co_return outcome::success();
    }

    auto first = scanned_up_to_ + 1;
    auto last = std::min<BlockNumber>(
        best_at_source,
        scanned_up_to_ + std::max<uint32_t>(timings_.max_headers_per_tick, 1));
    auto selected = CO_TRY(co_await selectHeader(first, last));
    if (not selected) {
      SL_TRACE(logger_,
               "[{}] No justified headers in #{}..=#{}",
               name_,
               first,
               scanned_up_to_);
      co_return outcome::success();
    }
    scanned_up_to_ = best_at_target.number;

    auto authority_set = CO_TRY(co_await target_->currentAuthoritySet());
    auto voters =
        CO_TRY(consensus::grandpa::VoterSet::make(authority_set));
    auto target_block = selected->header.blockInfo();
    auto size_before = CO_TRY(scale::encodedSize(selected->justification));
    CO_TRY(verifier_->optimize(target_block, selected->justification, *voters));
    auto size_after = CO_TRY(scale::encodedSize(selected->justification));
    SL_DEBUG(logger_,
             "[{}] Submitting {} header {} with justification of {} bytes "
             "(was {})",
             name_,
             selected->is_mandatory ? "mandatory" : "best",
             target_block,
             size_after,
             size_before);

    CO_TRY(co_await target_->submitFinalityProof(
        std::move(selected->header),
        std::move(selected->justification),
        authority_set.id));
    submitted_ = Submitted{
        .number = target_block.number,
        .at = std::chrono::steady_clock::now(),
    };
    metric_submitted_headers_->inc();
    SL_INFO(logger_, "[{}] Submitted header {}", name_, target_block);
    co_return outcome::success();
  }

  CoroOutcome<std::optional<FinalityLoop::Selected>> FinalityLoop::selectHeader(
      BlockNumber first, BlockNumber last) {
    std::optional<Selected> best;
    for (auto number = first; number <= last; ++number) {
      auto data = CO_TRY(co_await source_->headerAndJustification(number));
      primitives::calculateBlockHash(data.header, *hasher_);
      bool is_mandatory = primitives::findScheduledChange(data.header)
                       or primitives::findForcedChange(data.header);
      if (is_mandatory) {
        if (not data.justification) {
          SL_WARN(logger_,
                  "[{}] Mandatory header {} has no justification yet",
                  name_,
                  data.header.blockInfo());
          scanned_up_to_ = number - 1;
          co_return std::nullopt;
        }
        co_return Selected{
            .header = std::move(data.header),
            .justification = std::move(*data.justification),
            .is_mandatory = true,
        };
      }
      if (data.justification) {
        best = Selected{
            .header = std::move(data.header),
            .justification = std::move(*data.justification),
            .is_mandatory = false,
        };
      }
    }
    if (not best) {
      scanned_up_to_ = last;
    }
    co_return best;
  }

}  // namespace trestle::relay
