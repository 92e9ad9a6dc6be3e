/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/types.hpp"
#include "outcome/outcome.hpp"

namespace trestle::bridge::messages {

  class OutboundLaneStorage {
   public:
    virtual ~OutboundLaneStorage() = default;

    virtual const LaneId &id() const = 0;

    virtual outcome::result<OutboundLaneData> data() const = 0;

    virtual outcome::result<void> setData(const OutboundLaneData &data) = 0;

    virtual outcome::result<std::optional<MessagePayload>> message(
        MessageNonce nonce) const = 0;

    virtual outcome::result<void> saveMessage(
        MessageNonce nonce, const MessagePayload &payload) = 0;

    virtual outcome::result<void> removeMessage(MessageNonce nonce) = 0;
  };

  class InboundLaneStorage {
   public:
    virtual ~InboundLaneStorage() = default;

    virtual const LaneId &id() const = 0;

    virtual MessageNonce maxUnrewardedRelayerEntries() const = 0;

    virtual MessageNonce maxUnconfirmedMessages() const = 0;

    virtual outcome::result<InboundLaneData> data() const = 0;

    virtual outcome::result<void> setData(const InboundLaneData &data) = 0;
  };

}  // namespace trestle::bridge::messages
