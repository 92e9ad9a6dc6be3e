/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/message_lane_loop.hpp"

#include <algorithm>
#include <map>

#include "metrics/registry.hpp"

namespace {
  constexpr auto kGeneratedNonce = "trestle_relay_lane_latest_generated_nonce";
  constexpr auto kReceivedNonce = "trestle_relay_lane_latest_received_nonce";
  constexpr auto kConfirmedNonce = "trestle_relay_lane_latest_confirmed_nonce";
  constexpr auto kDeliveredMessages =
      "trestle_relay_lane_delivered_messages_total";
}  // namespace

namespace trestle::relay {

  std::optional<DeliveryPlan> planDelivery(const OutboundLaneData &outbound,
                                           const InboundLaneData &inbound,
                                           const MessageLaneParams &params) {
    auto last_delivered = inbound.lastDeliveredNonce();
    DeliveryPlan plan{
        .nonces = {.begin = last_delivered + 1, .end = last_delivered},
        .add_outbound_lane_data =
            outbound.latest_received_nonce > inbound.last_confirmed_nonce
            or outbound.state > inbound.state,
    };

    // confirmations the target applies before it receives the messages
    auto confirmed = inbound.last_confirmed_nonce;
    if (plan.add_outbound_lane_data
        and outbound.latest_received_nonce <= last_delivered) {
      confirmed = std::max(confirmed, outbound.latest_received_nonce);
    }
    auto entries = std::count_if(
        inbound.relayers.begin(),
        inbound.relayers.end(),
        [&](const auto &entry) { return entry.messages.end > confirmed; });
    bool extends_last_entry =
        entries != 0 and inbound.relayers.back().relayer == params.relayer;

    bridge::messages::MessageNonce max_messages = 0;
    if (static_cast<size_t>(entries) < params.max_unrewarded_relayer_entries) {
      max_messages = params.max_messages_in_tx;
      // the new entry fills the last slot, nothing can follow it
      if (not extends_last_entry
          and static_cast<size_t>(entries) + 1
                  == params.max_unrewarded_relayer_entries) {
        max_messages =
            std::min<bridge::messages::MessageNonce>(max_messages, 1);
      }
      auto unconfirmed = last_delivered - confirmed;
      max_messages = std::min(
          max_messages,
          params.max_unconfirmed_messages > unconfirmed
              ? params.max_unconfirmed_messages - unconfirmed
              : 0);
    }

    if (outbound.latest_generated_nonce > last_delivered and max_messages > 0) {
      plan.nonces.end =
          std::min(outbound.latest_generated_nonce,
                   last_delivered + max_messages);
    }
    if (plan.nonces.totalMessages() == 0 and not plan.add_outbound_lane_data) {
      return std::nullopt;
    }
    return plan;
  }

  MessageDeliveryRace::MessageDeliveryRace(
      std::string name,
      std::shared_ptr<MessagesSourceClient> source,
      std::shared_ptr<MessagesTargetClient> target,
      MessageLaneParams params)
      : name_{std::move(name)},
        source_{std::move(source)},
        target_{std::move(target)},
        params_{params},
        logger_{log::createLogger("MessageDeliveryRace", "messages_relay")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(target_ != nullptr);

    std::map<std::string, std::string> labels{
        {"lane", params_.lane.toHex()}};
    metrics_registry_->registerGaugeFamily(
        kGeneratedNonce, "Latest nonce generated at the source lane");
    metric_generated_nonce_ =
        metrics_registry_->registerGaugeMetric(kGeneratedNonce, labels);
    metrics_registry_->registerGaugeFamily(
        kReceivedNonce, "Latest nonce received by the target lane");
    metric_received_nonce_ =
        metrics_registry_->registerGaugeMetric(kReceivedNonce, labels);
    metrics_registry_->registerCounterFamily(
        kDeliveredMessages, "Number of messages submitted to the target lane");
    metric_delivered_messages_ =
        metrics_registry_->registerCounterMetric(kDeliveredMessages, labels);
  }

  CoroOutcome<void> MessageDeliveryRace::reconnect() {
    CO_TRY(co_await source_->reconnect());
    CO_TRY(co_await target_->reconnect());
    co_return outcome::success();
  }

  CoroOutcome<void> MessageDeliveryRace::tick() {
    auto source_at_target =
        CO_TRY(co_await target_->bestFinalizedSourceBlock());
    auto outbound = CO_TRY(co_await source_->outboundLaneData(
        params_.lane, source_at_target.hash));
    auto inbound =
        CO_TRY(co_await target_->inboundLaneData(params_.lane, std::nullopt));
    metric_generated_nonce_->set(outbound.latest_generated_nonce);
    metric_received_nonce_->set(inbound.lastDeliveredNonce());

    auto plan = planDelivery(outbound, inbound, params_);
    if (not plan) {
      SL_TRACE(logger_,
               "[{}] Nothing to deliver, generated {} received {}",
               name_,
               outbound.latest_generated_nonce,
               inbound.lastDeliveredNonce());
      co_return outcome::success();
    }

    auto count = plan->nonces.totalMessages();
    auto proof =
        CO_TRY(co_await source_->proveMessages(params_.lane,
                                               source_at_target.hash,
                                               plan->nonces.begin,
                                               plan->nonces.end,
                                               plan->add_outbound_lane_data));
    CO_TRY(co_await target_->submitMessagesProof(
        params_.relayer,
        std::move(proof),
        count,
        count * params_.dispatch_weight_per_message));
    metric_delivered_messages_->inc(static_cast<double>(count));
    if (count != 0) {
      SL_INFO(logger_,
              "[{}] Delivered messages {} at source block {}",
              name_,
              plan->nonces,
              source_at_target);
    } else {
      SL_DEBUG(logger_,
               "[{}] Delivered outbound lane state at source block {}",
               name_,
               source_at_target);
    }
    co_return outcome::success();
  }

  MessageConfirmationRace::MessageConfirmationRace(
      std::string name,
      std::shared_ptr<MessagesSourceClient> source,
      std::shared_ptr<MessagesTargetClient> target,
      MessageLaneParams params)
      : name_{std::move(name)},
        source_{std::move(source)},
        target_{std::move(target)},
        params_{params},
        logger_{
            log::createLogger("MessageConfirmationRace", "messages_relay")} {
    BOOST_ASSERT(source_ != nullptr);
    BOOST_ASSERT(target_ != nullptr);

    metrics_registry_->registerGaugeFamily(
        kConfirmedNonce, "Latest nonce confirmed at the source lane");
    metric_confirmed_nonce_ = metrics_registry_->registerGaugeMetric(
        kConfirmedNonce, {{"lane", params_.lane.toHex()}});
  }

  CoroOutcome<void> MessageConfirmationRace::reconnect() {
    CO_TRY(co_await source_->reconnect());
    CO_TRY(co_await target_->reconnect());
    co_return outcome::success();
  }

  CoroOutcome<void> MessageConfirmationRace::tick() {
    auto target_at_source =
        CO_TRY(co_await source_->bestFinalizedTargetBlock());
    auto inbound = CO_TRY(
        co_await target_->inboundLaneData(params_.lane, target_at_source.hash));
    auto outbound =
        CO_TRY(co_await source_->outboundLaneData(params_.lane, std::nullopt));
    metric_confirmed_nonce_->set(outbound.latest_received_nonce);

    if (inbound.lastDeliveredNonce() <= outbound.latest_received_nonce) {
      co_return outcome::success();
    }

    auto relayers_state =
        bridge::messages::UnrewardedRelayersState::from(inbound);
    auto proof = CO_TRY(co_await target_->proveMessagesDelivery(
        params_.lane, target_at_source.hash));
    CO_TRY(co_await source_->submitMessagesDeliveryProof(
        params_.relayer, std::move(proof), relayers_state));
    SL_INFO(logger_,
            "[{}] Confirmed delivery of messages {}..={} at target block {}",
            name_,
            outbound.latest_received_nonce + 1,
            inbound.lastDeliveredNonce(),
            target_at_source);
    co_return outcome::success();
  }

}  // namespace trestle::relay
