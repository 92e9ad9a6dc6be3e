/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::consensus::grandpa {

  enum class JustificationError : uint8_t {
    JUSTIFICATION_DECODE = 1,
    INVALID_JUSTIFICATION_TARGET,
    EQUIVOCATING_AUTHORITY_VOTE,
    UNRELATED_ANCESTRY_VOTE,
    REDUNDANT_VOTES_ANCESTRIES,
    TOO_LOW_CUMULATIVE_WEIGHT,
    INVALID_ROUND,
  };

}  // namespace trestle::consensus::grandpa

OUTCOME_HPP_DECLARE_ERROR(trestle::consensus::grandpa, JustificationError);
