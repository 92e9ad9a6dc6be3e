/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/vote_crypto.hpp"

namespace trestle::consensus::grandpa {

  namespace {
    // index of precommit in the prevote/precommit/primary propose enum
    constexpr uint8_t kPrecommitMessageIndex = 1;
  }  // namespace

  outcome::result<common::Buffer> precommitSignaturePayload(
      const Precommit &precommit, RoundNumber round, VoterSetId set_id) {
    return scale::encode(kPrecommitMessageIndex, precommit, round, set_id);
  }

  VoteCrypto::VoteCrypto(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      RoundNumber round,
      VoterSetId set_id)
      : ed25519_provider_{std::move(ed25519_provider)},
        round_{round},
        set_id_{set_id} {
    BOOST_ASSERT(ed25519_provider_ != nullptr);
  }

  outcome::result<SignedPrecommit> VoteCrypto::signPrecommit(
      const crypto::Ed25519Keypair &keypair, const Precommit &precommit) const {
    OUTCOME_TRY(payload, precommitSignaturePayload(precommit, round_, set_id_));
    OUTCOME_TRY(signature, ed25519_provider_->sign(keypair, payload));
    return SignedPrecommit{
        .precommit = precommit,
        .signature = signature,
        .id = keypair.public_key,
    };
  }

  outcome::result<bool> VoteCrypto::verifyPrecommit(
      const SignedPrecommit &vote) const {
    OUTCOME_TRY(payload,
                precommitSignaturePayload(vote.precommit, round_, set_id_));
    return ed25519_provider_->verify(vote.signature, payload, vote.id);
  }

}  // namespace trestle::consensus::grandpa
