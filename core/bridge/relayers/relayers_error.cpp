/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/relayers/relayers_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::bridge::relayers, RelayersError, e) {
  using E = trestle::bridge::relayers::RelayersError;
  switch (e) {
    case E::NO_REWARD_FOR_RELAYER:
      return "No reward can be claimed by the relayer";
    case E::FAILED_TO_PAY_REWARD:
      return "Reward payment procedure has failed";
  }
  return "Unknown error (invalid RelayersError)";
}
