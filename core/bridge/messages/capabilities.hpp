/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/types.hpp"

namespace trestle::bridge::messages {

  struct MessageDispatchResult {
    /// Part of the declared dispatch weight which was not used
    Weight unspent_weight = 0;
  };

  /**
   * Consumer of the messages delivered to the inbound lanes
   */
  class MessageDispatch {
   public:
    virtual ~MessageDispatch() = default;

    /// Inactive dispatcher makes deliveries fail before they are processed
    virtual bool isActive() const = 0;

    /// Weight the relayer must pay for the message dispatch
    virtual Weight dispatchWeight(const Message &message) const = 0;

    virtual MessageDispatchResult dispatch(const Message &message) = 0;
  };

  /**
   * Pays rewards to relayers once delivery of their messages is confirmed
   */
  class DeliveryConfirmationPayments {
   public:
    virtual ~DeliveryConfirmationPayments() = default;

    /**
     * @param relayers proven relayers of the inbound lane
     * @param confirmation_relayer relayer which brought the confirmation
     * @param received_range messages confirmed by this call
     * @return number of rewarded relayers
     */
    virtual size_t payReward(const LaneId &lane,
                             const UnrewardedRelayers &relayers,
                             const AccountId &confirmation_relayer,
                             const DeliveredMessages &received_range) = 0;
  };

  class NoopDeliveryConfirmationPayments final
      : public DeliveryConfirmationPayments {
   public:
    size_t payReward(const LaneId &,
                     const UnrewardedRelayers &,
                     const AccountId &,
                     const DeliveredMessages &) override {
      return 0;
    }
  };

  /**
   * Observer of the outbound lane queue, used to apply back pressure to the
   * message senders
   */
  class OnMessagesDelivered {
   public:
    virtual ~OnMessagesDelivered() = default;

    virtual void onMessagesDelivered(const LaneId &lane,
                                     MessageNonce enqueued_messages) = 0;
  };

  /**
   * Sends an opaque blob to the bridged chain
   */
  class HaulBlob {
   public:
    virtual ~HaulBlob() = default;

    virtual outcome::result<void> haulBlob(MessagePayload blob) = 0;
  };

}  // namespace trestle::bridge::messages
