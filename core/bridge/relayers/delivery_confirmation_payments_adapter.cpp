/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/relayers/delivery_confirmation_payments_adapter.hpp"

#include <map>

namespace trestle::bridge::relayers {

  DeliveryConfirmationPaymentsAdapter::DeliveryConfirmationPaymentsAdapter(
      std::shared_ptr<RelayersLedger> ledger,
      ChainId bridged_chain,
      RewardsConfig config)
      : ledger_{std::move(ledger)},
        bridged_chain_{bridged_chain},
        config_{config},
        logger_{log::createLogger("DeliveryPayments", "relayers")} {
    BOOST_ASSERT(ledger_ != nullptr);
  }

  size_t DeliveryConfirmationPaymentsAdapter::payReward(
      const messages::LaneId &lane,
      const messages::UnrewardedRelayers &relayers,
      const AccountId &confirmation_relayer,
      const messages::DeliveredMessages &received_range) {
    std::map<AccountId, messages::MessageNonce> delivered;
    for (auto &entry : relayers) {
      messages::DeliveredMessages confirmed{
          .begin = std::max(entry.messages.begin, received_range.begin),
          .end = std::min(entry.messages.end, received_range.end),
      };
      if (confirmed.totalMessages() != 0) {
        delivered[entry.relayer] += confirmed.totalMessages();
      }
    }

    RewardsAccountParams params{
        .lane = lane,
        .bridged_chain = bridged_chain_,
        .owner = RewardsAccountOwner::BRIDGED_CHAIN,
    };
    size_t rewarded = 0;
    for (auto &[relayer, count] : delivered) {
      auto reward = config_.delivery_reward_per_message * count;
      if (auto res = ledger_->registerRelayerReward(relayer, params, reward);
          res.has_error()) {
        SL_ERROR(logger_,
                 "Reward of relayer {} for {} messages is lost: {}",
                 relayer,
                 count,
                 res.error());
        continue;
      }
      ++rewarded;
    }

    if (auto res = ledger_->registerRelayerReward(
            confirmation_relayer, params, config_.confirmation_reward);
        res.has_error()) {
      SL_ERROR(logger_,
               "Confirmation reward of relayer {} is lost: {}",
               confirmation_relayer,
               res.error());
    }
    SL_DEBUG(logger_,
             "Rewarded {} relayers for messages {} of lane {}",
             rewarded,
             received_range,
             lane);
    return rewarded;
  }

}  // namespace trestle::bridge::relayers
