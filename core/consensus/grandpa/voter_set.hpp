/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "consensus/grandpa/common.hpp"
#include "outcome/outcome.hpp"

namespace trestle::consensus::grandpa {

  /**
   * Number of votes out of `n_authorities` equal-weight votes, which makes a
   * supermajority. Tolerates floor((n - 1) / 3) faulty voters.
   */
  uint32_t requiredVotes(uint32_t n_authorities);

  /**
   * Stores voters with their corresponding weights
   */
  struct VoterSet final {
   public:
    enum class Error : uint8_t {
      VOTER_ALREADY_EXISTS = 1,
      ZERO_WEIGHT,
      EMPTY_SET,
      WEIGHT_OVERFLOW,
    };

    using Index = size_t;
    using Weight = uint64_t;

    VoterSet() = default;

    explicit VoterSet(VoterSetId id_of_set);

    /**
     * Voter set of the authorities, rejects empty sets, zero weights and
     * repeated authorities
     */
    static outcome::result<std::shared_ptr<VoterSet>> make(
        const primitives::AuthoritySet &voters);

    /**
     * Insert voter \param voter with \param weight
     */
    outcome::result<void> insert(Id voter, Weight weight);

    /**
     * \return unique voter set membership id
     */
    inline VoterSetId id() const {
      return id_;
    }

    std::optional<Index> voterIndex(const Id &voter) const;

    /**
     * \return weight of \param voter
     */
    std::optional<Weight> voterWeight(const Id &voter) const;

    inline size_t size() const {
      return list_.size();
    }

    inline bool empty() const {
      return list_.empty();
    }

    /**
     * \return total weight of all voters
     */
    inline Weight totalWeight() const {
      return total_weight_;
    }

    /**
     * \return weight of votes finalizing a block,
     * total - floor((total - 1) / 3)
     */
    Weight threshold() const;

   private:
    VoterSetId id_{};
    std::unordered_map<Id, Index> map_;
    std::vector<std::pair<Id, Weight>> list_;
    Weight total_weight_{0};
  };

}  // namespace trestle::consensus::grandpa

OUTCOME_HPP_DECLARE_ERROR(trestle::consensus::grandpa, VoterSet::Error);
