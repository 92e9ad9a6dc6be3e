/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/scheduled_change.hpp"

namespace trestle::primitives {

  namespace {
    template <typename T>
    std::optional<T> findGrandpaLog(const BlockHeader &header) {
      for (const auto &item : header.digest) {
        const auto *consensus = std::get_if<Consensus>(&item.value);
        if (consensus == nullptr
            or consensus->consensus_engine_id != kGrandpaEngineId) {
          continue;
        }
        auto log = scale::decode<GrandpaConsensusLog>(consensus->data);
        if (log.has_error()) {
          continue;
        }
        if (auto *found = std::get_if<T>(&log.value().value)) {
          return std::move(*found);
        }
      }
      return std::nullopt;
    }
  }  // namespace

  outcome::result<DigestItem> makeGrandpaDigest(
      const GrandpaConsensusLog &log) {
    OUTCOME_TRY(data, scale::encode(log));
    Consensus consensus;
    consensus.consensus_engine_id = kGrandpaEngineId;
    consensus.data = std::move(data);
    return DigestItem{std::move(consensus)};
  }

  std::optional<ScheduledChange> findScheduledChange(
      const BlockHeader &header) {
    return findGrandpaLog<ScheduledChange>(header);
  }

  std::optional<ForcedChange> findForcedChange(const BlockHeader &header) {
    return findGrandpaLog<ForcedChange>(header);
  }

}  // namespace trestle::primitives
