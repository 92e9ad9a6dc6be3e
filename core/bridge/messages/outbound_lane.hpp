/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/lane_error.hpp"
#include "bridge/messages/lane_storage.hpp"

namespace trestle::bridge::messages {

  /**
   * Source chain side of a lane. Assigns nonces to the sent messages, keeps
   * them until their delivery is confirmed and prunes them afterwards.
   *
   * oldest_unpruned_nonce <= latest_received_nonce + 1 and
   * latest_received_nonce <= latest_generated_nonce hold after every
   * operation.
   */
  class OutboundLane {
   public:
    explicit OutboundLane(OutboundLaneStorage &storage);

    const LaneId &id() const {
      return storage_.id();
    }

    outcome::result<OutboundLaneData> data() const;

    /// Lane state only moves forward, other changes are ignored
    outcome::result<void> setState(LaneState state);

    /// Stores the message under the next nonce
    outcome::result<MessageNonce> sendMessage(const MessagePayload &payload);

    /**
     * Confirms delivery of messages up to the latest delivered nonce
     * @param max_allowed_messages number of messages the confirmation was
     * declared to cover
     * @param relayers proven relayers of the inbound lane
     * @return confirmed range or nullopt if nothing new is confirmed
     */
    outcome::result<std::optional<DeliveredMessages>> confirmDelivery(
        MessageNonce max_allowed_messages,
        MessageNonce latest_delivered_nonce,
        const UnrewardedRelayers &relayers);

    /**
     * Removes confirmed messages starting from the oldest one
     * @return number of removed messages
     */
    outcome::result<MessageNonce> pruneMessages(
        MessageNonce max_messages_to_prune);

   private:
    OutboundLaneStorage &storage_;
  };

}  // namespace trestle::bridge::messages
