/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::bridge::parachains {

  enum class ParachainsError : uint8_t {
    UNKNOWN_RELAY_CHAIN_BLOCK = 1,
    INVALID_RELAY_CHAIN_BLOCK_NUMBER,
    /// Update can't improve the stored head
    STALE,
  };

}  // namespace trestle::bridge::parachains

OUTCOME_HPP_DECLARE_ERROR(trestle::bridge::parachains, ParachainsError);
