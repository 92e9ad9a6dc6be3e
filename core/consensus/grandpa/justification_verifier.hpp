/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/buffer_view.hpp"
#include "consensus/grandpa/justification_error.hpp"
#include "consensus/grandpa/structs.hpp"
#include "consensus/grandpa/voter_set.hpp"
#include "crypto/ed25519_provider.hpp"
#include "crypto/hasher.hpp"

namespace trestle::consensus::grandpa {

  enum class VerificationPolicy : uint8_t {
    /// Any redundant data in the justification is an error
    STRICT,
    /// Redundant data is dropped from the justification
    OPTIMIZE,
  };

  /**
   * Bounds used to estimate the size of a reasonable justification
   */
  struct JustificationSizeLimits {
    /// Number of votes ancestries a justification usually carries
    uint32_t reasonable_headers = 2;
    uint32_t average_header_size = 512;
  };

  /**
   * Upper bound of the encoded size of a justification with
   * `required_precommits` precommits and a reasonable number of votes
   * ancestries. Saturates at the max of uint32.
   */
  uint32_t maxReasonableSize(uint32_t required_precommits,
                             const JustificationSizeLimits &limits = {});

  outcome::result<GrandpaJustification> decodeJustification(
      common::BufferView bytes);

  /**
   * Checks that a justification proves finality of a block by the given
   * voter set
   */
  class JustificationVerifier {
   public:
    JustificationVerifier(
        std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
        std::shared_ptr<crypto::Hasher> hasher);

    /**
     * Strict verification: equivocations, unrelated votes and redundant
     * ancestries are errors
     * @param target block finalized by the justification
     */
    outcome::result<void> verify(const BlockInfo &target,
                                 const GrandpaJustification &justification,
                                 const VoterSet &voters) const;

    /**
     * Removes every precommit not needed to reach the threshold and every
     * ancestry header not on the routes of the kept votes. The justification
     * is left untouched if it can not be valid.
     */
    outcome::result<void> optimize(const BlockInfo &target,
                                   GrandpaJustification &justification,
                                   const VoterSet &voters) const;

    outcome::result<void> verify(const BlockInfo &target,
                                 GrandpaJustification &justification,
                                 const VoterSet &voters,
                                 VerificationPolicy policy) const;

   private:
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    std::shared_ptr<crypto::Hasher> hasher_;
  };

}  // namespace trestle::consensus::grandpa
