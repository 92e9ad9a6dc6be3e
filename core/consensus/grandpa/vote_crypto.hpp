/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "consensus/grandpa/structs.hpp"
#include "crypto/ed25519_provider.hpp"

namespace trestle::consensus::grandpa {

  /**
   * Bytes an authority signs for a precommit: the precommit variant of the
   * vote message, followed by the round and the authority set id
   */
  outcome::result<common::Buffer> precommitSignaturePayload(
      const Precommit &precommit, RoundNumber round, VoterSetId set_id);

  /**
   * Signs precommits and checks their signatures for one round of one set
   */
  class VoteCrypto {
   public:
    VoteCrypto(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
               RoundNumber round,
               VoterSetId set_id);

    outcome::result<SignedPrecommit> signPrecommit(
        const crypto::Ed25519Keypair &keypair,
        const Precommit &precommit) const;

    /**
     * @return false for a wrong signature, error if the check itself could
     * not be performed
     */
    outcome::result<bool> verifyPrecommit(const SignedPrecommit &vote) const;

   private:
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    RoundNumber round_;
    VoterSetId set_id_;
  };

}  // namespace trestle::consensus::grandpa
