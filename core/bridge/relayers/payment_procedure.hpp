/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/relayers/types.hpp"

namespace trestle::bridge::relayers {

  /**
   * Transfers a claimed reward to the relayer
   */
  class PaymentProcedure {
   public:
    virtual ~PaymentProcedure() = default;

    virtual outcome::result<void> payReward(
        const AccountId &relayer,
        const RewardsAccountParams &params,
        Balance reward) = 0;
  };

}  // namespace trestle::bridge::relayers
