/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/voter_set.hpp"

#include <limits>

OUTCOME_CPP_DEFINE_CATEGORY(trestle::consensus::grandpa, VoterSet::Error, e) {
  using E = trestle::consensus::grandpa::VoterSet::Error;
  switch (e) {
    case E::VOTER_ALREADY_EXISTS:
      return "Voter already exists";
    case E::ZERO_WEIGHT:
      return "Voter has zero weight";
    case E::EMPTY_SET:
      return "Voter set is empty";
    case E::WEIGHT_OVERFLOW:
      return "Total weight of voters overflows";
  }
  return "Unknown error (invalid VoterSet::Error)";
}

namespace trestle::consensus::grandpa {

  uint32_t requiredVotes(uint32_t n_authorities) {
    if (n_authorities == 0) {
      return 0;
    }
    return n_authorities - (n_authorities - 1) / 3;
  }

  VoterSet::VoterSet(VoterSetId id_of_set) : id_{id_of_set} {}

  outcome::result<std::shared_ptr<VoterSet>> VoterSet::make(
      const primitives::AuthoritySet &voters) {
    if (voters.authorities.empty()) {
      return Error::EMPTY_SET;
    }
    auto set = std::make_shared<VoterSet>(voters.id);
    for (auto &voter : voters) {
      OUTCOME_TRY(set->insert(voter.id, voter.weight));
    }
    return set;
  }

  outcome::result<void> VoterSet::insert(Id voter, Weight weight) {
    if (weight == 0) {
      return Error::ZERO_WEIGHT;
    }
    if (total_weight_ > std::numeric_limits<Weight>::max() - weight) {
      return Error::WEIGHT_OVERFLOW;
    }
    auto r = map_.emplace(voter, list_.size());
    if (r.second) {
      list_.emplace_back(std::move(voter), weight);
      total_weight_ += weight;
      return outcome::success();
    }
    return Error::VOTER_ALREADY_EXISTS;
  }

  std::optional<VoterSet::Index> VoterSet::voterIndex(const Id &voter) const {
    auto it = map_.find(voter);
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<VoterSet::Weight> VoterSet::voterWeight(const Id &voter) const {
    auto index = voterIndex(voter);
    if (not index) {
      return std::nullopt;
    }
    return list_[*index].second;
  }

  VoterSet::Weight VoterSet::threshold() const {
    if (total_weight_ == 0) {
      return 0;
    }
    return total_weight_ - (total_weight_ - 1) / 3;
  }

}  // namespace trestle::consensus::grandpa
