/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/capabilities.hpp"
#include "bridge/messages/lane_storage.hpp"

namespace trestle::bridge::messages {

  /**
   * Target chain side of a lane. Accepts messages in nonce order, remembers
   * their relayers until the source chain confirms the delivery.
   */
  class InboundLane {
   public:
    explicit InboundLane(InboundLaneStorage &storage);

    const LaneId &id() const {
      return storage_.id();
    }

    outcome::result<InboundLaneData> data() const;

    /**
     * Applies the state of the outbound lane proven together with messages
     * @return new confirmed nonce, if any
     */
    outcome::result<std::optional<MessageNonce>> receiveStateUpdate(
        const OutboundLaneData &outbound_lane_data);

    /**
     * Dispatches the message if its nonce is the next one and the lane has
     * room for it
     */
    outcome::result<ReceptionResult> receiveMessage(
        const AccountId &relayer,
        MessageNonce nonce,
        const MessagePayload &payload,
        MessageDispatch &dispatch);

    /**
     * Removes relayer entries whose messages are all confirmed
     * @return number of removed entries
     */
    outcome::result<size_t> prune(size_t max_entries);

   private:
    InboundLaneStorage &storage_;
  };

}  // namespace trestle::bridge::messages
