/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <variant>

#include "consensus/grandpa/justification_error.hpp"
#include "consensus/grandpa/vote_walker.hpp"

namespace trestle::consensus::grandpa {

  /**
   * Finds authorities which signed different precommits in one round,
   * looking through any number of justifications of that round.
   * Only votes with valid signatures of authorities of the set are
   * considered, everything else in the justifications is ignored.
   */
  class EquivocationsCollector : public VoteWalker {
    struct PrivateTag {};

   public:
    EquivocationsCollector(
        PrivateTag,
        std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<const VoterSet> voters,
        RoundNumber round);

    /**
     * Collector of the round of `base_justification`, which is parsed
     * right away
     */
    static outcome::result<std::unique_ptr<EquivocationsCollector>> create(
        std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<const VoterSet> voters,
        const GrandpaJustification &base_justification);

    /**
     * Collects votes of another justification of the same round
     * @return INVALID_ROUND if the round differs, nothing is collected then
     */
    outcome::result<void> parseJustification(
        const GrandpaJustification &justification);

    /**
     * Takes the found equivocations out of the collector
     */
    std::vector<EquivocationProof> intoEquivocationProofs();

   protected:
    outcome::result<void> onKnownAuthorityVote(
        size_t index, const SignedPrecommit &vote) override;

    outcome::result<void> onEquivocation(size_t) override {
      return outcome::success();
    }

    outcome::result<void> onUnrelatedVote(size_t) override {
      return outcome::success();
    }

    outcome::result<void> onRedundantAncestries(
        const std::vector<size_t> &) override {
      return outcome::success();
    }

   private:
    std::shared_ptr<const VoterSet> voters_;
    RoundNumber round_;
    std::map<Id, std::variant<SignedPrecommit, Equivocation>> votes_;
  };

}  // namespace trestle::consensus::grandpa
