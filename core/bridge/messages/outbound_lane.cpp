/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/outbound_lane.hpp"

#include <limits>

namespace trestle::bridge::messages {

  namespace {
    outcome::result<void> ensureRelayersAreCorrect(
        MessageNonce latest_received_nonce,
        const UnrewardedRelayers &relayers) {
      if (relayers.empty()) {
        return outcome::success();
      }
      std::optional<MessageNonce> expected_begin =
          relayers.front().messages.begin;
      for (auto &entry : relayers) {
        if (entry.messages.end < entry.messages.begin) {
          return LaneError::EMPTY_UNREWARDED_RELAYER_ENTRY;
        }
        if (expected_begin != entry.messages.begin) {
          return LaneError::NON_CONSECUTIVE_UNREWARDED_RELAYER_ENTRIES;
        }
        if (entry.messages.end == std::numeric_limits<MessageNonce>::max()) {
          expected_begin.reset();
        } else {
          expected_begin = entry.messages.end + 1;
        }
        if (entry.messages.end > latest_received_nonce) {
          return LaneError::FAILED_TO_CONFIRM_FUTURE_MESSAGES;
        }
      }
      return outcome::success();
    }
  }  // namespace

  OutboundLane::OutboundLane(OutboundLaneStorage &storage)
      : storage_{storage} {}

  outcome::result<OutboundLaneData> OutboundLane::data() const {
    return storage_.data();
  }

  outcome::result<void> OutboundLane::setState(LaneState state) {
    OUTCOME_TRY(data, storage_.data());
    if (state <= data.state) {
      return outcome::success();
    }
    data.state = state;
    return storage_.setData(data);
  }

  outcome::result<MessageNonce> OutboundLane::sendMessage(
      const MessagePayload &payload) {
    OUTCOME_TRY(data, storage_.data());
    auto nonce = data.latest_generated_nonce + 1;
    data.latest_generated_nonce = nonce;
    OUTCOME_TRY(storage_.saveMessage(nonce, payload));
    OUTCOME_TRY(storage_.setData(data));
    return nonce;
  }

  outcome::result<std::optional<DeliveredMessages>>
  OutboundLane::confirmDelivery(MessageNonce max_allowed_messages,
                                MessageNonce latest_delivered_nonce,
                                const UnrewardedRelayers &relayers) {
    OUTCOME_TRY(data, storage_.data());
    DeliveredMessages confirmed{
        .begin = data.latest_received_nonce + 1,
        .end = latest_delivered_nonce,
    };
    if (confirmed.totalMessages() == 0) {
      return std::nullopt;
    }
    if (confirmed.end > data.latest_generated_nonce) {
      return LaneError::FAILED_TO_CONFIRM_FUTURE_MESSAGES;
    }
    if (confirmed.totalMessages() > max_allowed_messages) {
      return LaneError::TRYING_TO_CONFIRM_MORE_MESSAGES_THAN_EXPECTED;
    }
    OUTCOME_TRY(ensureRelayersAreCorrect(confirmed.end, relayers));

    data.latest_received_nonce = confirmed.end;
    OUTCOME_TRY(storage_.setData(data));
    return confirmed;
  }

  outcome::result<MessageNonce> OutboundLane::pruneMessages(
      MessageNonce max_messages_to_prune) {
    OUTCOME_TRY(data, storage_.data());
    MessageNonce pruned = 0;
    while (pruned < max_messages_to_prune
           and data.oldest_unpruned_nonce <= data.latest_received_nonce) {
      OUTCOME_TRY(storage_.removeMessage(data.oldest_unpruned_nonce));
      ++data.oldest_unpruned_nonce;
      ++pruned;
    }
    if (pruned > 0) {
      OUTCOME_TRY(storage_.setData(data));
    }
    return pruned;
  }

}  // namespace trestle::bridge::messages
