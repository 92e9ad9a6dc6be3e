/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/parachains/para_head_admission_filter.hpp"

namespace trestle::bridge::parachains {

  ParaHeadAdmissionFilter::ParaHeadAdmissionFilter(
      std::shared_ptr<const ParachainsModule> parachains)
      : parachains_{std::move(parachains)},
        logger_{log::createLogger("ParaHeadAdmissionFilter", "parachains")} {
    BOOST_ASSERT(parachains_ != nullptr);
  }

  outcome::result<void> ParaHeadAdmissionFilter::validate(
      const SubmitParachainHeadsCall &call) const {
    if (call.parachains.size() != 1) {
      return outcome::success();
    }
    const auto &update = call.parachains.front();
    OUTCOME_TRY(stored, parachains_->bestParaHead(update.para_id));
    if (not stored) {
      return outcome::success();
    }
    const auto &best = stored->best_head_hash;
    if (call.at_relay_block.number <= best.at_relay_block_number
        or update.head_hash == best.head_hash) {
      SL_TRACE(logger_,
               "Head {} of para {} at relay block #{} is stale, "
               "stored head {} is at #{}",
               update.head_hash,
               update.para_id,
               call.at_relay_block.number,
               best.head_hash,
               best.at_relay_block_number);
      return ParachainsError::STALE;
    }
    return outcome::success();
  }

}  // namespace trestle::bridge::parachains
