/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/messages_module.hpp"

#include <limits>

#include "bridge/messages/inbound_lane.hpp"
#include "bridge/messages/messages_proofs.hpp"
#include "bridge/messages/storage_keys.hpp"

namespace trestle::bridge::messages {

  MessagesModule::MessagesModule(
      std::shared_ptr<storage::BufferStorage> storage,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<const header_chain::HeaderChainModule> bridged_chain,
      std::shared_ptr<MessageDispatch> dispatch,
      std::shared_ptr<DeliveryConfirmationPayments> payments,
      std::shared_ptr<OnMessagesDelivered> on_messages_delivered,
      MessagesConfig config)
      : hasher_{std::move(hasher)},
        bridged_chain_{std::move(bridged_chain)},
        dispatch_{std::move(dispatch)},
        payments_{std::move(payments)},
        on_messages_delivered_{std::move(on_messages_delivered)},
        config_{config},
        outbound_lanes_{storage,
                        hasher_,
                        storage_keys::kModuleName,
                        storage_keys::kOutboundLanes},
        inbound_lanes_{storage,
                       hasher_,
                       storage_keys::kModuleName,
                       storage_keys::kInboundLanes},
        outbound_messages_{storage,
                           hasher_,
                           storage_keys::kModuleName,
                           storage_keys::kOutboundMessages},
        operating_mode_{storage,
                        hasher_,
                        storage_keys::kModuleName,
                        storage_keys::kOperatingMode},
        storage_version_{storage,
                         hasher_,
                         storage_keys::kModuleName,
                         storage_keys::kStorageVersion},
        logger_{log::createLogger("Messages", "messages")} {
    BOOST_ASSERT(bridged_chain_ != nullptr);
    BOOST_ASSERT(dispatch_ != nullptr);
    BOOST_ASSERT(payments_ != nullptr);
  }

  outcome::result<void> MessagesModule::initialize(
      MessagesOperatingMode mode) {
    OUTCOME_TRY(storage_version_.put(kStorageVersion));
    return setOperatingMode(mode);
  }

  outcome::result<void> MessagesModule::openLane(const LaneId &lane) {
    OUTCOME_TRY(ensureNotHalted());
    OUTCOME_TRY(has_outbound, outbound_lanes_.contains(lane));
    OUTCOME_TRY(has_inbound, inbound_lanes_.contains(lane));
    if (has_outbound or has_inbound) {
      return MessagesError::LANE_ALREADY_EXISTS;
    }
    OUTCOME_TRY(outbound_lanes_.put(lane, OutboundLaneData{}));
    OUTCOME_TRY(inbound_lanes_.put(lane, InboundLaneData{}));
    SL_INFO(logger_, "Lane {} is opened", lane);
    return outcome::success();
  }

  outcome::result<void> MessagesModule::requestLaneClosure(const LaneId &lane) {
    OUTCOME_TRY(ensureNotHalted());
    OUTCOME_TRY(data, outbound_lanes_.tryGet(lane));
    if (not data) {
      return MessagesError::UNKNOWN_LANE;
    }
    if (data->state != LaneState::OPENED) {
      return MessagesError::INACTIVE_OUTBOUND_LANE;
    }
    RuntimeOutboundLaneStorage lane_storage{
        lane, outbound_lanes_, outbound_messages_};
    OutboundLane outbound{lane_storage};
    OUTCOME_TRY(outbound.setState(LaneState::CLOSING));
    SL_INFO(logger_,
            "Lane {} is closing, {} messages are not confirmed yet",
            lane,
            data->queuedMessages().totalMessages());
    return closeIfDrained(outbound);
  }

  outcome::result<void> MessagesModule::setOperatingMode(
      MessagesOperatingMode mode) {
    OUTCOME_TRY(operating_mode_.put(static_cast<uint8_t>(mode)));
    SL_INFO(logger_, "Operating mode is set to {}", static_cast<int>(mode));
    return outcome::success();
  }

  outcome::result<MessagesOperatingMode> MessagesModule::operatingMode()
      const {
    OUTCOME_TRY(raw, operating_mode_.getOrDefault());
    if (raw > static_cast<uint8_t>(MessagesOperatingMode::HALTED)) {
      return storage::DatabaseError::CORRUPTION;
    }
    return static_cast<MessagesOperatingMode>(raw);
  }

  outcome::result<void> MessagesModule::ensureNotHalted() const {
    OUTCOME_TRY(mode, operatingMode());
    if (mode == MessagesOperatingMode::HALTED) {
      return MessagesError::HALTED;
    }
    return outcome::success();
  }

  outcome::result<SendMessageArtifacts> MessagesModule::sendMessage(
      const LaneId &lane, MessagePayload payload) {
    OUTCOME_TRY(mode, operatingMode());
    if (mode != MessagesOperatingMode::NORMAL) {
      return MessagesError::NOT_OPERATING_NORMALLY;
    }
    OUTCOME_TRY(data, outbound_lanes_.tryGet(lane));
    if (not data) {
      return MessagesError::UNKNOWN_LANE;
    }
    if (data->state != LaneState::OPENED) {
      return MessagesError::INACTIVE_OUTBOUND_LANE;
    }
    OUTCOME_TRY(size, scale::encodedSize(payload));
    if (size > config_.max_message_size) {
      return MessagesError::MESSAGE_IS_TOO_LARGE;
    }

    RuntimeOutboundLaneStorage lane_storage{
        lane, outbound_lanes_, outbound_messages_};
    OutboundLane outbound{lane_storage};
    OUTCOME_TRY(nonce, outbound.sendMessage(payload));
    OUTCOME_TRY(updated, outbound.data());
    SendMessageArtifacts artifacts{
        .nonce = nonce,
        .enqueued_messages = updated.queuedMessages().totalMessages(),
    };
    SL_TRACE(logger_,
             "Message {} of {} bytes is queued on lane {}",
             nonce,
             payload.size(),
             lane);
    return artifacts;
  }

  outcome::result<ReceivedMessages> MessagesModule::receiveMessagesProof(
      const AccountId &relayer,
      const MessagesProof &proof,
      MessageNonce messages_count,
      Weight dispatch_weight) {
    OUTCOME_TRY(ensureNotHalted());
    if (messages_count > config_.max_messages_in_proof) {
      return MessagesError::TOO_MANY_MESSAGES_IN_THE_PROOF;
    }
    if (not dispatch_->isActive()) {
      return MessagesError::MESSAGE_DISPATCH_INACTIVE;
    }

    auto proved =
        verifyMessagesProof(*bridged_chain_, *hasher_, proof, messages_count);
    if (proved.has_error()) {
      SL_DEBUG(logger_,
               "Rejecting invalid messages proof of lane {}: {}",
               proof.lane,
               proved.error());
      return MessagesError::INVALID_MESSAGES_PROOF;
    }
    auto &lane_messages = proved.value();

    OUTCOME_TRY(inbound_data, inbound_lanes_.tryGet(proof.lane));
    if (not inbound_data) {
      return MessagesError::UNKNOWN_LANE;
    }
    if (inbound_data->state == LaneState::CLOSED) {
      return MessagesError::INACTIVE_INBOUND_LANE;
    }

    // the whole declared weight is checked before anything is dispatched
    Weight required_weight = 0;
    for (auto &message : lane_messages.messages) {
      auto weight = dispatch_->dispatchWeight(message);
      required_weight = weight > std::numeric_limits<Weight>::max()
                                     - required_weight
                          ? std::numeric_limits<Weight>::max()
                          : required_weight + weight;
    }
    if (required_weight > dispatch_weight) {
      return MessagesError::INSUFFICIENT_DISPATCH_WEIGHT;
    }

    RuntimeInboundLaneStorage lane_storage{proof.lane, inbound_lanes_, config_};
    InboundLane inbound{lane_storage};
    if (lane_messages.lane_state) {
      OUTCOME_TRY(confirmed,
                  inbound.receiveStateUpdate(*lane_messages.lane_state));
      if (confirmed) {
        SL_TRACE(logger_,
                 "Source confirmed messages up to {} on lane {}",
                 *confirmed,
                 proof.lane);
      }
    }

    ReceivedMessages received{.lane = proof.lane};
    size_t dispatched = 0;
    for (auto &message : lane_messages.messages) {
      OUTCOME_TRY(result,
                  inbound.receiveMessage(
                      relayer, message.key.nonce, message.payload, *dispatch_));
      if (result == ReceptionResult::DISPATCHED) {
        ++dispatched;
      }
      received.receive_results.emplace_back(message.key.nonce, result);
    }
    SL_DEBUG(logger_,
             "Received {} messages on lane {}, {} dispatched",
             received.receive_results.size(),
             proof.lane,
             dispatched);
    return received;
  }

  outcome::result<std::optional<DeliveredMessages>>
  MessagesModule::receiveMessagesDeliveryProof(
      const AccountId &relayer,
      const MessagesDeliveryProof &proof,
      const UnrewardedRelayersState &relayers_state) {
    OUTCOME_TRY(ensureNotHalted());

    auto lane_data =
        verifyMessagesDeliveryProof(*bridged_chain_, *hasher_, proof);
    if (lane_data.has_error()) {
      SL_DEBUG(logger_,
               "Rejecting invalid delivery proof of lane {}: {}",
               proof.lane,
               lane_data.error());
      return MessagesError::INVALID_MESSAGES_DELIVERY_PROOF;
    }
    if (not relayers_state.isValid(lane_data.value())) {
      return MessagesError::INVALID_UNREWARDED_RELAYERS_STATE;
    }

    OUTCOME_TRY(has_lane, outbound_lanes_.contains(proof.lane));
    if (not has_lane) {
      return MessagesError::UNKNOWN_LANE;
    }
    RuntimeOutboundLaneStorage lane_storage{
        proof.lane, outbound_lanes_, outbound_messages_};
    OutboundLane outbound{lane_storage};
    OUTCOME_TRY(confirmed,
                outbound.confirmDelivery(relayers_state.total_messages,
                                         relayers_state.last_delivered_nonce,
                                         lane_data.value().relayers));
    if (confirmed) {
      auto rewarded = payments_->payReward(
          proof.lane, lane_data.value().relayers, relayer, *confirmed);
      SL_DEBUG(logger_,
               "Delivery of messages {} on lane {} is confirmed, "
               "{} relayers rewarded",
               *confirmed,
               proof.lane,
               rewarded);
      OUTCOME_TRY(closeIfDrained(outbound));
    }

    if (on_messages_delivered_) {
      OUTCOME_TRY(data, outbound.data());
      on_messages_delivered_->onMessagesDelivered(
          proof.lane, data.queuedMessages().totalMessages());
    }
    return confirmed;
  }

  outcome::result<MessageNonce> MessagesModule::onIdle(
      MessageNonce max_messages_to_prune) {
    MessageNonce pruned = 0;
    OUTCOME_TRY(outbound_lanes, outbound_lanes_.keys());
    for (auto &lane : outbound_lanes) {
      if (pruned >= max_messages_to_prune) {
        break;
      }
      RuntimeOutboundLaneStorage lane_storage{
          lane, outbound_lanes_, outbound_messages_};
      OutboundLane outbound{lane_storage};
      OUTCOME_TRY(lane_pruned,
                  outbound.pruneMessages(max_messages_to_prune - pruned));
      pruned += lane_pruned;
      OUTCOME_TRY(closeIfDrained(outbound));
    }

    OUTCOME_TRY(inbound_lanes, inbound_lanes_.keys());
    for (auto &lane : inbound_lanes) {
      RuntimeInboundLaneStorage lane_storage{lane, inbound_lanes_, config_};
      InboundLane inbound{lane_storage};
      OUTCOME_TRY(inbound.prune(config_.max_unrewarded_relayer_entries));
    }

    if (pruned > 0) {
      SL_TRACE(logger_, "Pruned {} delivered messages", pruned);
    }
    return pruned;
  }

  outcome::result<void> MessagesModule::closeIfDrained(OutboundLane &lane) {
    OUTCOME_TRY(data, lane.data());
    if (data.state != LaneState::CLOSING
        or data.latest_received_nonce != data.latest_generated_nonce) {
      return outcome::success();
    }
    OUTCOME_TRY(lane.setState(LaneState::CLOSED));
    SL_INFO(logger_, "Lane {} is closed", lane.id());
    return outcome::success();
  }

  outcome::result<std::optional<OutboundLaneData>>
  MessagesModule::outboundLaneData(const LaneId &lane) const {
    return outbound_lanes_.tryGet(lane);
  }

  outcome::result<std::optional<InboundLaneData>>
  MessagesModule::inboundLaneData(const LaneId &lane) const {
    return inbound_lanes_.tryGet(lane);
  }

  outcome::result<std::optional<MessagePayload>>
  MessagesModule::outboundMessage(const LaneId &lane,
                                  MessageNonce nonce) const {
    return outbound_messages_.tryGet({.lane_id = lane, .nonce = nonce});
  }

  outcome::result<std::vector<LaneId>> MessagesModule::outboundLanes() const {
    return outbound_lanes_.keys();
  }

  LaneBlobHauler::LaneBlobHauler(std::shared_ptr<MessagesModule> messages,
                                 LaneId lane)
      : messages_{std::move(messages)},
        lane_{lane},
        logger_{log::createLogger("LaneBlobHauler", "messages")} {
    BOOST_ASSERT(messages_ != nullptr);
  }

  outcome::result<void> LaneBlobHauler::haulBlob(MessagePayload blob) {
    auto size = blob.size();
    auto res = messages_->sendMessage(lane_, std::move(blob));
    if (res.has_error()) {
      SL_WARN(logger_,
              "Blob of {} bytes is not sent over lane {}: {}",
              size,
              lane_,
              res.error());
      return res.as_failure();
    }
    SL_TRACE(logger_,
             "Blob of {} bytes is sent over lane {} as message {}",
             size,
             lane_,
             res.value().nonce);
    return outcome::success();
  }

}  // namespace trestle::bridge::messages
