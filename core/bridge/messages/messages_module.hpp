/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/header_chain/header_chain_module.hpp"
#include "bridge/messages/capabilities.hpp"
#include "bridge/messages/messages_error.hpp"
#include "bridge/messages/outbound_lane.hpp"
#include "bridge/messages/runtime_lane_storage.hpp"
#include "log/logger.hpp"

namespace trestle::bridge::messages {

  /**
   * Message lanes of one bridge. Accepts outbound messages, receives
   * messages proven at the bridged chain and confirmations of the delivery
   * of its own messages, pays relayers through the payments capability.
   */
  class MessagesModule {
   public:
    /// Version of the storage layout the module reads and writes
    static constexpr uint16_t kStorageVersion = 1;

    MessagesModule(
        std::shared_ptr<storage::BufferStorage> storage,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<const header_chain::HeaderChainModule> bridged_chain,
        std::shared_ptr<MessageDispatch> dispatch,
        std::shared_ptr<DeliveryConfirmationPayments> payments,
        std::shared_ptr<OnMessagesDelivered> on_messages_delivered,
        MessagesConfig config);

    /**
     * Writes the storage version and the operating mode of a fresh module
     */
    outcome::result<void> initialize(MessagesOperatingMode mode);

    /// Opens both sides of the lane
    outcome::result<void> openLane(const LaneId &lane);

    /**
     * Stops accepting messages on the lane. The lane is closed once all of
     * its messages are confirmed.
     */
    outcome::result<void> requestLaneClosure(const LaneId &lane);

    outcome::result<void> setOperatingMode(MessagesOperatingMode mode);

    outcome::result<MessagesOperatingMode> operatingMode() const;

    /**
     * Queues the message on the outbound lane. Nothing is changed on error.
     */
    outcome::result<SendMessageArtifacts> sendMessage(const LaneId &lane,
                                                      MessagePayload payload);

    /**
     * Receives messages proven at the bridged chain and dispatches them
     * @param relayer account of the delivering relayer at the bridged chain
     * @param messages_count number of messages in the proof
     * @param dispatch_weight weight the relayer pays for the dispatch of all
     * of the messages
     */
    outcome::result<ReceivedMessages> receiveMessagesProof(
        const AccountId &relayer,
        const MessagesProof &proof,
        MessageNonce messages_count,
        Weight dispatch_weight);

    /**
     * Confirms delivery of the outbound messages and rewards relayers
     * @param relayers_state summary of the proven inbound lane, declared by
     * the confirming relayer
     * @return newly confirmed messages, if any
     */
    outcome::result<std::optional<DeliveredMessages>>
    receiveMessagesDeliveryProof(const AccountId &relayer,
                                 const MessagesDeliveryProof &proof,
                                 const UnrewardedRelayersState &relayers_state);

    /**
     * Background cleanup: prunes confirmed messages and relayer entries
     * @return number of pruned messages
     */
    outcome::result<MessageNonce> onIdle(MessageNonce max_messages_to_prune);

    outcome::result<std::optional<OutboundLaneData>> outboundLaneData(
        const LaneId &lane) const;

    outcome::result<std::optional<InboundLaneData>> inboundLaneData(
        const LaneId &lane) const;

    outcome::result<std::optional<MessagePayload>> outboundMessage(
        const LaneId &lane, MessageNonce nonce) const;

    outcome::result<std::vector<LaneId>> outboundLanes() const;

    const MessagesConfig &config() const {
      return config_;
    }

   private:
    outcome::result<void> ensureNotHalted() const;

    outcome::result<void> closeIfDrained(OutboundLane &lane);

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<const header_chain::HeaderChainModule> bridged_chain_;
    std::shared_ptr<MessageDispatch> dispatch_;
    std::shared_ptr<DeliveryConfirmationPayments> payments_;
    std::shared_ptr<OnMessagesDelivered> on_messages_delivered_;
    MessagesConfig config_;

    OutboundLanesMap outbound_lanes_;
    InboundLanesMap inbound_lanes_;
    OutboundMessagesMap outbound_messages_;
    storage::StorageValue<uint8_t> operating_mode_;
    storage::StorageValue<uint16_t> storage_version_;

    log::Logger logger_;
  };

  /**
   * Hauls blobs over one lane of the messages module
   */
  class LaneBlobHauler final : public HaulBlob {
   public:
    LaneBlobHauler(std::shared_ptr<MessagesModule> messages, LaneId lane);

    outcome::result<void> haulBlob(MessagePayload blob) override;

   private:
    std::shared_ptr<MessagesModule> messages_;
    LaneId lane_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::messages
