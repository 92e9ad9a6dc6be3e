/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "consensus/grandpa/vote_crypto.hpp"
#include "consensus/grandpa/voter_set.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"

namespace testutil {

  using trestle::consensus::grandpa::GrandpaJustification;
  using trestle::consensus::grandpa::Precommit;
  using trestle::consensus::grandpa::RoundNumber;
  using trestle::consensus::grandpa::SignedPrecommit;
  using trestle::consensus::grandpa::VoterSet;
  using trestle::consensus::grandpa::VoterSetId;
  using trestle::primitives::BlockHeader;
  using trestle::primitives::BlockInfo;

  /**
   * Authorities with deterministic keys, signing precommits over a test
   * chain of headers
   */
  class JustificationBuilder {
   public:
    JustificationBuilder(size_t authorities,
                         VoterSetId set_id = 1,
                         RoundNumber round = 1)
        : hasher_{std::make_shared<trestle::crypto::HasherImpl>()},
          ed25519_{std::make_shared<trestle::crypto::Ed25519ProviderImpl>()},
          set_id_{set_id},
          round_{round} {
      for (size_t i = 0; i < authorities; ++i) {
        keys_.emplace_back(keypair(fmt::format("//Authority//{}", i)));
      }
    }

    const std::shared_ptr<trestle::crypto::HasherImpl> &hasher() const {
      return hasher_;
    }

    const std::shared_ptr<trestle::crypto::Ed25519ProviderImpl> &ed25519()
        const {
      return ed25519_;
    }

    trestle::crypto::Ed25519Keypair keypair(const std::string &phrase) const {
      trestle::crypto::Ed25519Seed seed{
          hasher_->blake2b_256(trestle::common::Buffer::fromString(phrase))};
      return ed25519_->generateKeypair(seed);
    }

    const trestle::crypto::Ed25519Keypair &key(size_t index) const {
      return keys_.at(index);
    }

    trestle::primitives::AuthoritySet authoritySet() const {
      trestle::primitives::AuthorityList list;
      for (auto &keypair : keys_) {
        list.emplace_back(trestle::primitives::Authority{
            .id = keypair.public_key, .weight = 1});
      }
      return {set_id_, std::move(list)};
    }

    std::shared_ptr<VoterSet> voterSet() const {
      return VoterSet::make(authoritySet()).value();
    }

    /**
     * Headers #1..#length built on top of `parent`, with hashes
     * @param salt makes forks of the same length distinct
     */
    std::vector<BlockHeader> chain(const BlockInfo &parent,
                                   size_t length,
                                   uint8_t salt = 0) const {
      std::vector<BlockHeader> headers;
      auto parent_info = parent;
      for (size_t i = 0; i < length; ++i) {
        BlockHeader header;
        header.number = parent_info.number + 1;
        header.parent_hash = parent_info.hash;
        header.extrinsics_root[0] = salt;
        trestle::primitives::calculateBlockHash(header, *hasher_);
        parent_info = header.blockInfo();
        headers.emplace_back(std::move(header));
      }
      return headers;
    }

    SignedPrecommit sign(size_t authority, const BlockInfo &target) const {
      return sign(key(authority), target);
    }

    SignedPrecommit sign(const trestle::crypto::Ed25519Keypair &keypair,
                         const BlockInfo &target) const {
      trestle::consensus::grandpa::VoteCrypto crypto{
          ed25519_, round_, set_id_};
      Precommit precommit{target.number, target.hash};
      return crypto.signPrecommit(keypair, precommit).value();
    }

    /**
     * Justification for `target` signed by the first `voters` authorities,
     * all of them voting for the target itself
     */
    GrandpaJustification justify(const BlockInfo &target,
                                 size_t voters) const {
      GrandpaJustification justification{
          .round = round_,
          .commit = {.target_hash = target.hash,
                     .target_number = target.number},
      };
      for (size_t i = 0; i < voters; ++i) {
        justification.commit.precommits.emplace_back(sign(i, target));
      }
      return justification;
    }

   private:
    std::shared_ptr<trestle::crypto::HasherImpl> hasher_;
    std::shared_ptr<trestle::crypto::Ed25519ProviderImpl> ed25519_;
    VoterSetId set_id_;
    RoundNumber round_;
    std::vector<trestle::crypto::Ed25519Keypair> keys_;
  };

}  // namespace testutil
