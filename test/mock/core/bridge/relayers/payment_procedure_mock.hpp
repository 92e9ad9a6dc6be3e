/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/relayers/payment_procedure.hpp"

#include <gmock/gmock.h>

namespace trestle::bridge::relayers {

  class PaymentProcedureMock : public PaymentProcedure {
   public:
    MOCK_METHOD(outcome::result<void>,
                payReward,
                (const AccountId &, const RewardsAccountParams &, Balance),
                (override));
  };

}  // namespace trestle::bridge::relayers
