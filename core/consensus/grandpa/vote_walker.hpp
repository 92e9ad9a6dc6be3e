/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "consensus/grandpa/header_ancestry_graph.hpp"
#include "consensus/grandpa/structs.hpp"
#include "consensus/grandpa/voter_set.hpp"
#include "crypto/ed25519_provider.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace trestle::consensus::grandpa {

  /**
   * Walks over the precommits of a justification and classifies every
   * vote. Checks are done in order: signature, membership of the
   * authority, repeated vote, equivocating vote, relation of the vote
   * target to the commit target. Derived classes decide what every
   * outcome means to them; a hook returning an error stops the walk.
   */
  class VoteWalker {
   public:
    virtual ~VoteWalker() = default;

   protected:
    VoteWalker(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
               std::shared_ptr<crypto::Hasher> hasher,
               log::Logger logger);

    /**
     * Visits every precommit and the votes ancestries
     * @return cumulative weight of the accepted votes
     */
    outcome::result<VoterSet::Weight> walk(
        const GrandpaJustification &justification, const VoterSet &voters);

    /// Called before any checks of a vote once the threshold is reached,
    /// return true to skip the vote
    virtual bool skipVoteAboveThreshold(size_t index) {
      return false;
    }

    virtual outcome::result<void> onInvalidSignature(size_t index) {
      return outcome::success();
    }

    virtual outcome::result<void> onUnknownAuthority(size_t index) {
      return outcome::success();
    }

    /// Vote with a valid signature of a known authority, before the checks
    /// of repetition and relation
    virtual outcome::result<void> onKnownAuthorityVote(
        size_t index, const SignedPrecommit &vote) {
      return outcome::success();
    }

    virtual outcome::result<void> onDuplicateVote(size_t index) {
      return outcome::success();
    }

    virtual outcome::result<void> onEquivocation(size_t index) = 0;

    virtual outcome::result<void> onUnrelatedVote(size_t index) = 0;

    virtual outcome::result<void> onVoteAccepted(size_t index) {
      return outcome::success();
    }

    /// Positions of ancestry headers which are not on any accepted route
    /// or repeat another header
    virtual outcome::result<void> onRedundantAncestries(
        const std::vector<size_t> &indices) = 0;

    log::Logger logger_;

   private:
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    std::shared_ptr<crypto::Hasher> hasher_;
  };

}  // namespace trestle::consensus::grandpa
