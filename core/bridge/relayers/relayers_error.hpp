/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::bridge::relayers {

  enum class RelayersError : uint8_t {
    NO_REWARD_FOR_RELAYER = 1,
    FAILED_TO_PAY_REWARD,
  };

}  // namespace trestle::bridge::relayers

OUTCOME_HPP_DECLARE_ERROR(trestle::bridge::relayers, RelayersError);
