/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/justification_verifier.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "consensus/grandpa/vote_walker.hpp"

namespace trestle::consensus::grandpa {

  namespace {
    // round u64 with the target number u32 and hash of the commit
    constexpr uint64_t kCommitOverheadSize = 8 + 4 + 32;
    // hash and number of the target, signature and authority id
    constexpr uint64_t kSignedPrecommitSize = 32 + 4 + 64 + 32;

    class StrictVerifier : public VoteWalker {
     public:
      StrictVerifier(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                     std::shared_ptr<crypto::Hasher> hasher)
          : VoteWalker{std::move(ed25519_provider),
                       std::move(hasher),
                       log::createLogger("JustificationVerifier", "grandpa")} {}

      outcome::result<VoterSet::Weight> run(
          const GrandpaJustification &justification, const VoterSet &voters) {
        return walk(justification, voters);
      }

     protected:
      outcome::result<void> onEquivocation(size_t) override {
        return JustificationError::EQUIVOCATING_AUTHORITY_VOTE;
      }

      outcome::result<void> onUnrelatedVote(size_t) override {
        return JustificationError::UNRELATED_ANCESTRY_VOTE;
      }

      outcome::result<void> onRedundantAncestries(
          const std::vector<size_t> &indices) override {
        SL_DEBUG(logger_, "{} redundant votes ancestries", indices.size());
        return JustificationError::REDUNDANT_VOTES_ANCESTRIES;
      }
    };

    class Optimizer : public VoteWalker {
     public:
      Optimizer(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                std::shared_ptr<crypto::Hasher> hasher)
          : VoteWalker{
              std::move(ed25519_provider),
              std::move(hasher),
              log::createLogger("JustificationOptimizer", "grandpa")} {}

      outcome::result<VoterSet::Weight> run(
          const GrandpaJustification &justification, const VoterSet &voters) {
        return walk(justification, voters);
      }

      void apply(GrandpaJustification &justification) const {
        eraseIndices(justification.commit.precommits, redundant_votes_);
        eraseIndices(justification.votes_ancestries, redundant_ancestries_);
      }

     protected:
      bool skipVoteAboveThreshold(size_t index) override {
        redundant_votes_.insert(index);
        return true;
      }

      outcome::result<void> onInvalidSignature(size_t index) override {
        redundant_votes_.insert(index);
        return outcome::success();
      }

      outcome::result<void> onUnknownAuthority(size_t index) override {
        redundant_votes_.insert(index);
        return outcome::success();
      }

      outcome::result<void> onDuplicateVote(size_t index) override {
        redundant_votes_.insert(index);
        return outcome::success();
      }

      outcome::result<void> onEquivocation(size_t index) override {
        redundant_votes_.insert(index);
        return outcome::success();
      }

      outcome::result<void> onUnrelatedVote(size_t index) override {
        redundant_votes_.insert(index);
        return outcome::success();
      }

      outcome::result<void> onRedundantAncestries(
          const std::vector<size_t> &indices) override {
        redundant_ancestries_.insert(indices.begin(), indices.end());
        return outcome::success();
      }

     private:
      template <typename T>
      static void eraseIndices(std::vector<T> &items,
                               const std::set<size_t> &indices) {
        // from the back, so positions of the rest stay valid
        for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
          items.erase(items.begin() + static_cast<ptrdiff_t>(*it));
        }
      }

      std::set<size_t> redundant_votes_;
      std::set<size_t> redundant_ancestries_;
    };

    outcome::result<void> checkTarget(
        const BlockInfo &target, const GrandpaJustification &justification) {
      if (justification.commit.target() != target) {
        return JustificationError::INVALID_JUSTIFICATION_TARGET;
      }
      return outcome::success();
    }

    outcome::result<void> checkWeight(VoterSet::Weight weight,
                                      const VoterSet &voters) {
      if (weight < voters.threshold()) {
        return JustificationError::TOO_LOW_CUMULATIVE_WEIGHT;
      }
      return outcome::success();
    }
  }  // namespace

  uint32_t maxReasonableSize(uint32_t required_precommits,
                             const JustificationSizeLimits &limits) {
    uint64_t size = kCommitOverheadSize
                  + kSignedPrecommitSize * required_precommits
                  + uint64_t{limits.reasonable_headers}
                        * limits.average_header_size;
    return static_cast<uint32_t>(
        std::min<uint64_t>(size, std::numeric_limits<uint32_t>::max()));
  }

  outcome::result<GrandpaJustification> decodeJustification(
      common::BufferView bytes) {
    auto justification = scale::decode<GrandpaJustification>(bytes);
    if (justification.has_error()) {
      return JustificationError::JUSTIFICATION_DECODE;
    }
    return std::move(justification.value());
  }

  JustificationVerifier::JustificationVerifier(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      std::shared_ptr<crypto::Hasher> hasher)
      : ed25519_provider_{std::move(ed25519_provider)},
        hasher_{std::move(hasher)} {
    BOOST_ASSERT(ed25519_provider_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<void> JustificationVerifier::verify(
      const BlockInfo &target,
      const GrandpaJustification &justification,
      const VoterSet &voters) const {
    OUTCOME_TRY(checkTarget(target, justification));
    StrictVerifier verifier{ed25519_provider_, hasher_};
    OUTCOME_TRY(weight, verifier.run(justification, voters));
    return checkWeight(weight, voters);
  }

  outcome::result<void> JustificationVerifier::optimize(
      const BlockInfo &target,
      GrandpaJustification &justification,
      const VoterSet &voters) const {
    OUTCOME_TRY(checkTarget(target, justification));
    Optimizer optimizer{ed25519_provider_, hasher_};
    OUTCOME_TRY(weight, optimizer.run(justification, voters));
    OUTCOME_TRY(checkWeight(weight, voters));
    optimizer.apply(justification);
    return outcome::success();
  }

  outcome::result<void> JustificationVerifier::verify(
      const BlockInfo &target,
      GrandpaJustification &justification,
      const VoterSet &voters,
      VerificationPolicy policy) const {
    switch (policy) {
      case VerificationPolicy::STRICT:
        return verify(target,
                      static_cast<const GrandpaJustification &>(justification),
                      voters);
      case VerificationPolicy::OPTIMIZE:
        return optimize(target, justification, voters);
    }
    return outcome::success();
  }

}  // namespace trestle::consensus::grandpa
