/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/dev_capabilities.hpp"

#include <limits>

namespace trestle::devnet {

  DevMessageDispatch::DevMessageDispatch(
      bridge::messages::Weight weight_per_message)
      : weight_per_message_{weight_per_message},
        logger_{log::createLogger("DevMessageDispatch", "devnet")} {}

  bridge::messages::Weight DevMessageDispatch::dispatchWeight(
      const bridge::messages::Message &) const {
    return weight_per_message_;
  }

  bridge::messages::MessageDispatchResult DevMessageDispatch::dispatch(
      const bridge::messages::Message &message) {
    ++dispatched_;
    SL_DEBUG(logger_,
             "Dispatched message {} of lane {}, {} bytes",
             message.key.nonce,
             message.key.lane_id,
             message.payload.size());
    return {};
  }

  outcome::result<void> DevPaymentProcedure::payReward(
      const bridge::AccountId &relayer,
      const bridge::relayers::RewardsAccountParams &,
      bridge::Balance reward) {
    auto &balance = balances_[relayer];
    balance = reward > std::numeric_limits<bridge::Balance>::max() - balance
                ? std::numeric_limits<bridge::Balance>::max()
                : balance + reward;
    return outcome::success();
  }

  bridge::Balance DevPaymentProcedure::balance(
      const bridge::AccountId &relayer) const {
    auto it = balances_.find(relayer);
    return it == balances_.end() ? 0 : it->second;
  }

}  // namespace trestle::devnet
