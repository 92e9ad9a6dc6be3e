/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/relayers/relayers_ledger.hpp"

#include <limits>

namespace trestle::bridge::relayers {

  RelayersLedger::RelayersLedger(
      std::shared_ptr<storage::BufferStorage> storage,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<PaymentProcedure> payment_procedure)
      : payment_procedure_{std::move(payment_procedure)},
        rewards_{std::move(storage), std::move(hasher), kModuleName,
                 "RelayerRewards"},
        logger_{log::createLogger("RelayersLedger", "relayers")} {
    BOOST_ASSERT(payment_procedure_ != nullptr);
  }

  outcome::result<void> RelayersLedger::registerRelayerReward(
      const AccountId &relayer,
      const RewardsAccountParams &params,
      Balance reward) {
    if (reward == 0) {
      return outcome::success();
    }
    RelayerRewardKey key{.relayer = relayer, .params = params};
    OUTCOME_TRY(old_reward, rewards_.tryGet(key));
    auto new_reward = old_reward.value_or(0);
    new_reward = reward > std::numeric_limits<Balance>::max() - new_reward
                   ? std::numeric_limits<Balance>::max()
                   : new_reward + reward;
    OUTCOME_TRY(rewards_.put(key, new_reward));
    SL_TRACE(logger_,
             "Relayer {} can now claim {} from {}",
             relayer,
             new_reward,
             params);
    return outcome::success();
  }

  outcome::result<std::optional<Balance>> RelayersLedger::relayerReward(
      const AccountId &relayer, const RewardsAccountParams &params) const {
    return rewards_.tryGet({.relayer = relayer, .params = params});
  }

  outcome::result<Balance> RelayersLedger::claimRewards(
      const AccountId &relayer, const RewardsAccountParams &params) {
    RelayerRewardKey key{.relayer = relayer, .params = params};
    OUTCOME_TRY(reward, rewards_.tryGet(key));
    if (not reward) {
      return RelayersError::NO_REWARD_FOR_RELAYER;
    }
    auto paid = payment_procedure_->payReward(relayer, params, *reward);
    if (paid.has_error()) {
      SL_ERROR(logger_,
               "Failed to pay {} from {} to {}: {}",
               *reward,
               params,
               relayer,
               paid.error());
      return RelayersError::FAILED_TO_PAY_REWARD;
    }
    OUTCOME_TRY(rewards_.remove(key));
    SL_DEBUG(logger_, "Paid {} from {} to {}", *reward, params, relayer);
    return *reward;
  }

}  // namespace trestle::bridge::relayers
