/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/inbound_lane.hpp"

namespace trestle::bridge::messages {

  InboundLane::InboundLane(InboundLaneStorage &storage) : storage_{storage} {}

  outcome::result<InboundLaneData> InboundLane::data() const {
    return storage_.data();
  }

  outcome::result<std::optional<MessageNonce>> InboundLane::receiveStateUpdate(
      const OutboundLaneData &outbound_lane_data) {
    OUTCOME_TRY(data, storage_.data());
    bool changed = false;
    if (outbound_lane_data.state > data.state) {
      data.state = outbound_lane_data.state;
      changed = true;
    }

    std::optional<MessageNonce> confirmed;
    auto new_confirmed_nonce = outbound_lane_data.latest_received_nonce;
    // source can't confirm messages which are not delivered yet
    if (new_confirmed_nonce <= data.lastDeliveredNonce()
        and new_confirmed_nonce > data.last_confirmed_nonce) {
      data.last_confirmed_nonce = new_confirmed_nonce;
      while (not data.relayers.empty()
             and data.relayers.front().messages.end <= new_confirmed_nonce) {
        data.relayers.pop_front();
      }
      if (not data.relayers.empty()
          and data.relayers.front().messages.begin <= new_confirmed_nonce) {
        data.relayers.front().messages.begin = new_confirmed_nonce + 1;
      }
      confirmed = new_confirmed_nonce;
      changed = true;
    }

    if (changed) {
      OUTCOME_TRY(storage_.setData(data));
    }
    return confirmed;
  }

  outcome::result<ReceptionResult> InboundLane::receiveMessage(
      const AccountId &relayer,
      MessageNonce nonce,
      const MessagePayload &payload,
      MessageDispatch &dispatch) {
    OUTCOME_TRY(data, storage_.data());
    if (nonce != data.lastDeliveredNonce() + 1) {
      return ReceptionResult::INVALID_NONCE;
    }
    if (data.relayers.size() >= storage_.maxUnrewardedRelayerEntries()) {
      return ReceptionResult::TOO_MANY_UNREWARDED_RELAYERS;
    }
    if (nonce - data.last_confirmed_nonce
        > storage_.maxUnconfirmedMessages()) {
      return ReceptionResult::TOO_MANY_UNCONFIRMED_MESSAGES;
    }

    dispatch.dispatch(Message{
        .key = {.lane_id = storage_.id(), .nonce = nonce},
        .payload = payload,
    });

    if (not data.relayers.empty() and data.relayers.back().relayer == relayer) {
      data.relayers.back().messages.noteDispatchedMessage();
    } else {
      data.relayers.push_back(UnrewardedRelayer{
          .relayer = relayer,
          .messages = DeliveredMessages::single(nonce),
      });
    }
    OUTCOME_TRY(storage_.setData(data));
    return ReceptionResult::DISPATCHED;
  }

  outcome::result<size_t> InboundLane::prune(size_t max_entries) {
    OUTCOME_TRY(data, storage_.data());
    size_t pruned = 0;
    while (pruned < max_entries and not data.relayers.empty()
           and data.relayers.front().messages.end
                   <= data.last_confirmed_nonce) {
      data.relayers.pop_front();
      ++pruned;
    }
    if (pruned > 0) {
      OUTCOME_TRY(storage_.setData(data));
    }
    return pruned;
  }

}  // namespace trestle::bridge::messages
