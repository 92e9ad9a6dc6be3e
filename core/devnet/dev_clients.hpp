/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "devnet/dev_chain.hpp"
#include "relay/clients.hpp"

namespace trestle::devnet {

  /**
   * Connection to a development chain node. Calls fail with a connection
   * error while the node is unreachable. Submitted calls pass the same
   * pool checks as on a real node before they are dispatched.
   */
  class DevClient {
   protected:
    explicit DevClient(std::shared_ptr<DevChain> chain);

    outcome::result<void> ensureConnected() const;

    /// State of the block, UNKNOWN_BLOCK if it is not kept
    outcome::result<std::shared_ptr<storage::InMemoryStorage>> stateAt(
        const primitives::BlockHash &hash) const;

    /// Best block of the bridged chain imported by this chain
    outcome::result<primitives::BlockInfo> bestBridgedBlock() const;

    std::shared_ptr<DevChain> chain_;
  };

  class DevFinalitySourceClient final : public relay::FinalitySourceClient,
                                        private DevClient {
   public:
    explicit DevFinalitySourceClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<primitives::BlockNumber> bestFinalizedBlockNumber() override;

    CoroOutcome<relay::HeaderAndJustification> headerAndJustification(
        primitives::BlockNumber number) override;
  };

  class DevFinalityTargetClient final : public relay::FinalityTargetClient,
                                        private DevClient {
   public:
    explicit DevFinalityTargetClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<primitives::BlockInfo> bestFinalizedSourceBlock() override;

    CoroOutcome<primitives::AuthoritySet> currentAuthoritySet() override;

    CoroOutcome<void> submitFinalityProof(
        primitives::BlockHeader header,
        consensus::grandpa::GrandpaJustification justification,
        primitives::AuthoritySetId current_set_id) override;
  };

  class DevMessagesSourceClient final : public relay::MessagesSourceClient,
                                        private DevClient {
   public:
    explicit DevMessagesSourceClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<primitives::BlockInfo> bestFinalizedTargetBlock() override;

    CoroOutcome<bridge::messages::OutboundLaneData> outboundLaneData(
        const bridge::messages::LaneId &lane,
        std::optional<primitives::BlockHash> at) override;

    CoroOutcome<bridge::messages::MessagesProof> proveMessages(
        const bridge::messages::LaneId &lane,
        const primitives::BlockHash &at,
        bridge::messages::MessageNonce begin,
        bridge::messages::MessageNonce end,
        bool add_outbound_lane_data) override;

    CoroOutcome<void> submitMessagesDeliveryProof(
        const bridge::AccountId &relayer,
        bridge::messages::MessagesDeliveryProof proof,
        bridge::messages::UnrewardedRelayersState relayers_state) override;
  };

  class DevMessagesTargetClient final : public relay::MessagesTargetClient,
                                        private DevClient {
   public:
    explicit DevMessagesTargetClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<primitives::BlockInfo> bestFinalizedSourceBlock() override;

    CoroOutcome<bridge::messages::InboundLaneData> inboundLaneData(
        const bridge::messages::LaneId &lane,
        std::optional<primitives::BlockHash> at) override;

    CoroOutcome<bridge::messages::MessagesDeliveryProof> proveMessagesDelivery(
        const bridge::messages::LaneId &lane,
        const primitives::BlockHash &at) override;

    CoroOutcome<void> submitMessagesProof(
        const bridge::AccountId &relayer,
        bridge::messages::MessagesProof proof,
        bridge::messages::MessageNonce messages_count,
        bridge::messages::Weight dispatch_weight) override;
  };

  class DevParachainsSourceClient final : public relay::ParachainsSourceClient,
                                          private DevClient {
   public:
    explicit DevParachainsSourceClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<std::optional<bridge::parachains::ParaHead>> paraHead(
        bridge::parachains::ParaId para_id,
        const primitives::BlockHash &at) override;

    CoroOutcome<storage::StateProof> proveParaHeads(
        const std::vector<bridge::parachains::ParaId> &para_ids,
        const primitives::BlockHash &at) override;
  };

  class DevParachainsTargetClient final : public relay::ParachainsTargetClient,
                                          private DevClient {
   public:
    explicit DevParachainsTargetClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<primitives::BlockInfo> bestFinalizedSourceBlock() override;

    CoroOutcome<std::optional<bridge::parachains::BestParaHeadHash>>
    bestParaHeadHash(bridge::parachains::ParaId para_id) override;

    CoroOutcome<void> submitParachainHeads(
        primitives::BlockInfo at_relay_block,
        std::vector<bridge::parachains::ParaHeadUpdate> updates,
        storage::StateProof heads_proof) override;
  };

  class DevRuntimeVersionClient final : public relay::RuntimeVersionClient,
                                        private DevClient {
   public:
    explicit DevRuntimeVersionClient(std::shared_ptr<DevChain> chain);

    CoroOutcome<void> reconnect() override;

    CoroOutcome<primitives::RuntimeVersion> runtimeVersion() override;
  };

}  // namespace trestle::devnet
