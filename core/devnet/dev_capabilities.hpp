/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include "bridge/messages/capabilities.hpp"
#include "bridge/relayers/payment_procedure.hpp"
#include "log/logger.hpp"

namespace trestle::devnet {

  /**
   * Dispatcher of the development chain. Counts dispatched messages, every
   * message costs the same weight.
   */
  class DevMessageDispatch final : public bridge::messages::MessageDispatch {
   public:
    explicit DevMessageDispatch(bridge::messages::Weight weight_per_message);

    bool isActive() const override {
      return active_;
    }

    void setActive(bool active) {
      active_ = active;
    }

    bridge::messages::Weight dispatchWeight(
        const bridge::messages::Message &message) const override;

    bridge::messages::MessageDispatchResult dispatch(
        const bridge::messages::Message &message) override;

    size_t dispatched() const {
      return dispatched_;
    }

   private:
    bridge::messages::Weight weight_per_message_;
    bool active_ = true;
    size_t dispatched_ = 0;
    log::Logger logger_;
  };

  /// Keeps balances of the paid relayers in memory
  class DevPaymentProcedure final : public bridge::relayers::PaymentProcedure {
   public:
    outcome::result<void> payReward(
        const bridge::AccountId &relayer,
        const bridge::relayers::RewardsAccountParams &params,
        bridge::Balance reward) override;

    bridge::Balance balance(const bridge::AccountId &relayer) const;

   private:
    std::unordered_map<bridge::AccountId, bridge::Balance> balances_;
  };

}  // namespace trestle::devnet
