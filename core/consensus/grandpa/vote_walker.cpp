/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/vote_walker.hpp"

#include <unordered_map>

#include "consensus/grandpa/vote_crypto.hpp"

namespace trestle::consensus::grandpa {

  VoteWalker::VoteWalker(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      std::shared_ptr<crypto::Hasher> hasher,
      log::Logger logger)
      : logger_{std::move(logger)},
        ed25519_provider_{std::move(ed25519_provider)},
        hasher_{std::move(hasher)} {
    BOOST_ASSERT(ed25519_provider_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<VoterSet::Weight> VoteWalker::walk(
      const GrandpaJustification &justification, const VoterSet &voters) {
    const auto &commit = justification.commit;
    auto graph = HeaderAncestryGraph::build(justification.votes_ancestries,
                                            *hasher_);
    VoteCrypto vote_crypto{ed25519_provider_, justification.round, voters.id()};
    const auto threshold = voters.threshold();

    VoterSet::Weight cumulative_weight = 0;
    std::unordered_map<Id, Precommit> votes;

    for (size_t index = 0; index < commit.precommits.size(); ++index) {
      const auto &vote = commit.precommits[index];

      if (cumulative_weight >= threshold and skipVoteAboveThreshold(index)) {
        continue;
      }

      auto signature_valid = vote_crypto.verifyPrecommit(vote);
      if (signature_valid.has_error()) {
        SL_DEBUG(logger_,
                 "Signature of precommit #{} by {} can't be checked: {}",
                 index,
                 vote.id,
                 signature_valid.error());
      }
      if (not signature_valid.has_value() or not signature_valid.value()) {
        SL_TRACE(logger_, "Precommit #{} has invalid signature", index);
        OUTCOME_TRY(onInvalidSignature(index));
        continue;
      }

      auto weight = voters.voterWeight(vote.id);
      if (not weight) {
        SL_TRACE(logger_,
                 "Precommit #{} by unknown authority {}",
                 index,
                 vote.id);
        OUTCOME_TRY(onUnknownAuthority(index));
        continue;
      }

      OUTCOME_TRY(onKnownAuthorityVote(index, vote));

      if (auto it = votes.find(vote.id); it != votes.end()) {
        if (it->second == vote.precommit) {
          OUTCOME_TRY(onDuplicateVote(index));
        } else {
          SL_DEBUG(logger_,
                   "Authority {} votes for {} and {} in round {}",
                   vote.id,
                   it->second,
                   vote.precommit,
                   justification.round);
          OUTCOME_TRY(onEquivocation(index));
        }
        continue;
      }

      auto route = graph.route(commit.target_hash, vote.precommit.hash);
      if (not route) {
        SL_DEBUG(logger_,
                 "Precommit #{} for {} is not related to commit target {}",
                 index,
                 vote.precommit,
                 commit.target());
        OUTCOME_TRY(onUnrelatedVote(index));
        continue;
      }

      graph.markVisited(*route);
      votes.emplace(vote.id, vote.precommit);
      cumulative_weight += *weight;
      OUTCOME_TRY(onVoteAccepted(index));
    }

    if (auto redundant = graph.unvisitedIndices(); not redundant.empty()) {
      OUTCOME_TRY(onRedundantAncestries(redundant));
    }

    return cumulative_weight;
  }

}  // namespace trestle::consensus::grandpa
