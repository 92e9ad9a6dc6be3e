/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/parachains/parachains_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::bridge::parachains, ParachainsError, e) {
  using E = trestle::bridge::parachains::ParachainsError;
  switch (e) {
    case E::UNKNOWN_RELAY_CHAIN_BLOCK:
      return "Relay chain block is not imported";
    case E::INVALID_RELAY_CHAIN_BLOCK_NUMBER:
      return "Relay chain block number does not match the imported block";
    case E::STALE:
      return "Parachain head update is not newer than the stored one";
  }
  return "Unknown error (invalid ParachainsError)";
}
