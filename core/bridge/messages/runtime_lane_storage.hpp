/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/lane_storage.hpp"
#include "storage/storage_item.hpp"

namespace trestle::bridge::messages {

  using OutboundLanesMap = storage::StorageMap<LaneId, OutboundLaneData>;
  using InboundLanesMap = storage::StorageMap<LaneId, InboundLaneData>;
  using OutboundMessagesMap = storage::StorageMap<MessageKey, MessagePayload>;

  /**
   * Outbound lane kept in the storage maps of the messages module
   */
  class RuntimeOutboundLaneStorage final : public OutboundLaneStorage {
   public:
    RuntimeOutboundLaneStorage(LaneId lane,
                               OutboundLanesMap &lanes,
                               OutboundMessagesMap &messages)
        : lane_{lane}, lanes_{lanes}, messages_{messages} {}

    const LaneId &id() const override {
      return lane_;
    }

    outcome::result<OutboundLaneData> data() const override {
      return lanes_.get(lane_);
    }

    outcome::result<void> setData(const OutboundLaneData &data) override {
      return lanes_.put(lane_, data);
    }

    outcome::result<std::optional<MessagePayload>> message(
        MessageNonce nonce) const override {
      return messages_.tryGet({lane_, nonce});
    }

    outcome::result<void> saveMessage(MessageNonce nonce,
                                      const MessagePayload &payload) override {
      return messages_.put({lane_, nonce}, payload);
    }

    outcome::result<void> removeMessage(MessageNonce nonce) override {
      return messages_.remove({lane_, nonce});
    }

   private:
    LaneId lane_;
    OutboundLanesMap &lanes_;
    OutboundMessagesMap &messages_;
  };

  class RuntimeInboundLaneStorage final : public InboundLaneStorage {
   public:
    RuntimeInboundLaneStorage(LaneId lane,
                              InboundLanesMap &lanes,
                              const MessagesConfig &config)
        : lane_{lane}, lanes_{lanes}, config_{config} {}

    const LaneId &id() const override {
      return lane_;
    }

    MessageNonce maxUnrewardedRelayerEntries() const override {
      return config_.max_unrewarded_relayer_entries;
    }

    MessageNonce maxUnconfirmedMessages() const override {
      return config_.max_unconfirmed_messages;
    }

    outcome::result<InboundLaneData> data() const override {
      return lanes_.get(lane_);
    }

    outcome::result<void> setData(const InboundLaneData &data) override {
      return lanes_.put(lane_, data);
    }

   private:
    LaneId lane_;
    InboundLanesMap &lanes_;
    const MessagesConfig &config_;
  };

}  // namespace trestle::bridge::messages
