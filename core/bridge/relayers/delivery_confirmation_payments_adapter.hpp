/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/capabilities.hpp"
#include "bridge/relayers/relayers_ledger.hpp"

namespace trestle::bridge::relayers {

  struct RewardsConfig {
    /// Reward of the delivering relayer per each confirmed message
    Balance delivery_reward_per_message = 0;
    /// Reward of the relayer which brought the confirmation
    Balance confirmation_reward = 0;
  };

  /**
   * Registers rewards in the ledger when the delivery is confirmed. Each
   * delivering relayer gets a reward proportional to the number of its
   * confirmed messages.
   */
  class DeliveryConfirmationPaymentsAdapter final
      : public messages::DeliveryConfirmationPayments {
   public:
    DeliveryConfirmationPaymentsAdapter(std::shared_ptr<RelayersLedger> ledger,
                                        ChainId bridged_chain,
                                        RewardsConfig config);

    size_t payReward(const messages::LaneId &lane,
                     const messages::UnrewardedRelayers &relayers,
                     const AccountId &confirmation_relayer,
                     const messages::DeliveredMessages &received_range)
        override;

   private:
    std::shared_ptr<RelayersLedger> ledger_;
    ChainId bridged_chain_;
    RewardsConfig config_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::relayers
