/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "relay/relay_task.hpp"

#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "relay/clients.hpp"
#include "relay/relay_config.hpp"

namespace trestle::relay {

  /// Nonces selected for the next messages delivery transaction
  struct DeliveryPlan {
    /// Empty when only the outbound lane state is delivered
    bridge::messages::DeliveredMessages nonces;
    bool add_outbound_lane_data = false;

    bool operator==(const DeliveryPlan &rhs) const = default;
  };

  /**
   * Chooses the messages to deliver, so that the target inbound lane
   * accepts all of them.
   * @param outbound lane data at the source block known to the target
   * @param inbound lane data at the best target block
   * @return nullopt if there is nothing to deliver or the target can't accept
   * more messages before the confirmation
   */
  std::optional<DeliveryPlan> planDelivery(const OutboundLaneData &outbound,
                                           const InboundLaneData &inbound,
                                           const MessageLaneParams &params);

  /**
   * Delivers messages of a lane from the source to the target chain.
   * Messages are proven at the best source block known to the target.
   */
  class MessageDeliveryRace final : public RelayTask {
   public:
    MessageDeliveryRace(std::string name,
                        std::shared_ptr<MessagesSourceClient> source,
                        std::shared_ptr<MessagesTargetClient> target,
                        MessageLaneParams params);

    const std::string &name() const override {
      return name_;
    }

    CoroOutcome<void> tick() override;

    CoroOutcome<void> reconnect() override;

   private:
    std::string name_;
    std::shared_ptr<MessagesSourceClient> source_;
    std::shared_ptr<MessagesTargetClient> target_;
    MessageLaneParams params_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Gauge *metric_generated_nonce_;
    metrics::Gauge *metric_received_nonce_;
    metrics::Counter *metric_delivered_messages_;

    log::Logger logger_;
  };

  /**
   * Delivers proofs of the target inbound lane state back to the source
   * chain, which confirms the messages and pays the relayers.
   */
  class MessageConfirmationRace final : public RelayTask {
   public:
    MessageConfirmationRace(std::string name,
                            std::shared_ptr<MessagesSourceClient> source,
                            std::shared_ptr<MessagesTargetClient> target,
                            MessageLaneParams params);

    const std::string &name() const override {
      return name_;
    }

    CoroOutcome<void> tick() override;

    CoroOutcome<void> reconnect() override;

   private:
    std::string name_;
    std::shared_ptr<MessagesSourceClient> source_;
    std::shared_ptr<MessagesTargetClient> target_;
    MessageLaneParams params_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();
    metrics::Gauge *metric_confirmed_nonce_;

    log::Logger logger_;
  };

}  // namespace trestle::relay
