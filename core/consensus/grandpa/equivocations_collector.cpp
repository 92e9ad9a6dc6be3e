/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/equivocations_collector.hpp"

namespace trestle::consensus::grandpa {

  EquivocationsCollector::EquivocationsCollector(
      PrivateTag,
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<const VoterSet> voters,
      RoundNumber round)
      : VoteWalker{std::move(ed25519_provider),
                   std::move(hasher),
                   log::createLogger("EquivocationsCollector", "grandpa")},
        voters_{std::move(voters)},
        round_{round} {
    BOOST_ASSERT(voters_ != nullptr);
  }

  outcome::result<std::unique_ptr<EquivocationsCollector>>
  EquivocationsCollector::create(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<const VoterSet> voters,
      const GrandpaJustification &base_justification) {
    auto collector =
        std::make_unique<EquivocationsCollector>(PrivateTag{},
                                                 std::move(ed25519_provider),
                                                 std::move(hasher),
                                                 std::move(voters),
                                                 base_justification.round);
    OUTCOME_TRY(collector->parseJustification(base_justification));
    return collector;
  }

  outcome::result<void> EquivocationsCollector::parseJustification(
      const GrandpaJustification &justification) {
    if (justification.round != round_) {
      return JustificationError::INVALID_ROUND;
    }
    // the cumulative weight is of no interest here
    OUTCOME_TRY(walk(justification, *voters_));
    return outcome::success();
  }

  outcome::result<void> EquivocationsCollector::onKnownAuthorityVote(
      size_t, const SignedPrecommit &vote) {
    auto it = votes_.find(vote.id);
    if (it == votes_.end()) {
      votes_.emplace(vote.id, vote);
      return outcome::success();
    }
    if (auto *first = std::get_if<SignedPrecommit>(&it->second)) {
      if (first->precommit != vote.precommit) {
        SL_VERBOSE(logger_,
                   "Authority {} equivocated in round {}: {} and {}",
                   vote.id,
                   round_,
                   first->precommit,
                   vote.precommit);
        it->second = Equivocation{
            .round = round_,
            .id = vote.id,
            .first = *first,
            .second = vote,
        };
      }
    }
    return outcome::success();
  }

  std::vector<EquivocationProof>
  EquivocationsCollector::intoEquivocationProofs() {
    std::vector<EquivocationProof> proofs;
    for (auto &[id, vote] : votes_) {
      if (auto *equivocation = std::get_if<Equivocation>(&vote)) {
        proofs.emplace_back(EquivocationProof{
            .set_id = voters_->id(),
            .equivocation = std::move(*equivocation),
        });
      }
    }
    votes_.clear();
    return proofs;
  }

}  // namespace trestle::consensus::grandpa
