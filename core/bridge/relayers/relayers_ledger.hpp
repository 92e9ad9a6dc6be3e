/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/relayers/payment_procedure.hpp"
#include "bridge/relayers/relayers_error.hpp"
#include "log/logger.hpp"
#include "storage/storage_item.hpp"

namespace trestle::bridge::relayers {

  /**
   * Rewards accumulated by relayers until they claim them
   */
  class RelayersLedger {
   public:
    static constexpr std::string_view kModuleName = "BridgeRelayers";

    RelayersLedger(std::shared_ptr<storage::BufferStorage> storage,
                   std::shared_ptr<crypto::Hasher> hasher,
                   std::shared_ptr<PaymentProcedure> payment_procedure);

    /**
     * Adds the reward to the relayer balance, saturating. Zero rewards are
     * not recorded.
     */
    outcome::result<void> registerRelayerReward(
        const AccountId &relayer,
        const RewardsAccountParams &params,
        Balance reward);

    outcome::result<std::optional<Balance>> relayerReward(
        const AccountId &relayer, const RewardsAccountParams &params) const;

    /**
     * Pays the whole accumulated reward and forgets it
     * @return paid amount, NO_REWARD_FOR_RELAYER or FAILED_TO_PAY_REWARD
     */
    outcome::result<Balance> claimRewards(const AccountId &relayer,
                                          const RewardsAccountParams &params);

   private:
    std::shared_ptr<PaymentProcedure> payment_procedure_;
    storage::StorageMap<RelayerRewardKey, Balance> rewards_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::relayers
