/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/ed25519_types.hpp"
#include "primitives/authority.hpp"
#include "primitives/common.hpp"

namespace trestle::consensus::grandpa {

  using Id = crypto::Ed25519PublicKey;
  using Signature = crypto::Ed25519Signature;

  using BlockNumber = primitives::BlockNumber;
  using BlockHash = primitives::BlockHash;
  using BlockInfo = primitives::BlockInfo;

  using RoundNumber = uint64_t;
  using VoterSetId = uint64_t;

}  // namespace trestle::consensus::grandpa
