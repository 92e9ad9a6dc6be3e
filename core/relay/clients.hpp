/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/types.hpp"
#include "bridge/parachains/types.hpp"
#include "consensus/grandpa/structs.hpp"
#include "coro/coro.hpp"
#include "primitives/authority.hpp"
#include "primitives/block_header.hpp"
#include "primitives/runtime_version.hpp"

/**
 * Views of the chains used by the relay tasks. Each task owns its clients,
 * a failed client is reconnected by its task only.
 */
namespace trestle::relay {

  using bridge::messages::InboundLaneData;
  using bridge::messages::LaneId;
  using bridge::messages::MessageNonce;
  using bridge::messages::MessagesDeliveryProof;
  using bridge::messages::MessagesProof;
  using bridge::messages::OutboundLaneData;
  using bridge::messages::UnrewardedRelayersState;
  using bridge::messages::Weight;
  using consensus::grandpa::GrandpaJustification;
  using primitives::BlockHash;
  using primitives::BlockHeader;
  using primitives::BlockInfo;
  using primitives::BlockNumber;

  struct HeaderAndJustification {
    BlockHeader header;
    std::optional<GrandpaJustification> justification;
  };

  /// Chain whose finalized headers are relayed
  class FinalitySourceClient {
   public:
    virtual ~FinalitySourceClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    virtual CoroOutcome<BlockNumber> bestFinalizedBlockNumber() = 0;

    /// Finalized header with its justification, if the node keeps one
    virtual CoroOutcome<HeaderAndJustification> headerAndJustification(
        BlockNumber number) = 0;
  };

  /// Chain importing the relayed headers into its header chain module
  class FinalityTargetClient {
   public:
    virtual ~FinalityTargetClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    virtual CoroOutcome<BlockInfo> bestFinalizedSourceBlock() = 0;

    virtual CoroOutcome<primitives::AuthoritySet> currentAuthoritySet() = 0;

    virtual CoroOutcome<void> submitFinalityProof(
        BlockHeader header,
        GrandpaJustification justification,
        primitives::AuthoritySetId current_set_id) = 0;
  };

  /// Chain sending messages and receiving delivery confirmations
  class MessagesSourceClient {
   public:
    virtual ~MessagesSourceClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    /// Best target header imported by the source header chain
    virtual CoroOutcome<BlockInfo> bestFinalizedTargetBlock() = 0;

    /// Lane data at the block, or at the best block if none is given
    virtual CoroOutcome<OutboundLaneData> outboundLaneData(
        const LaneId &lane, std::optional<BlockHash> at) = 0;

    virtual CoroOutcome<MessagesProof> proveMessages(
        const LaneId &lane,
        const BlockHash &at,
        MessageNonce begin,
        MessageNonce end,
        bool add_outbound_lane_data) = 0;

    virtual CoroOutcome<void> submitMessagesDeliveryProof(
        const bridge::AccountId &relayer,
        MessagesDeliveryProof proof,
        UnrewardedRelayersState relayers_state) = 0;
  };

  /// Chain receiving messages
  class MessagesTargetClient {
   public:
    virtual ~MessagesTargetClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    /// Best source header imported by the target header chain
    virtual CoroOutcome<BlockInfo> bestFinalizedSourceBlock() = 0;

    virtual CoroOutcome<InboundLaneData> inboundLaneData(
        const LaneId &lane, std::optional<BlockHash> at) = 0;

    virtual CoroOutcome<MessagesDeliveryProof> proveMessagesDelivery(
        const LaneId &lane, const BlockHash &at) = 0;

    virtual CoroOutcome<void> submitMessagesProof(
        const bridge::AccountId &relayer,
        MessagesProof proof,
        MessageNonce messages_count,
        Weight dispatch_weight) = 0;
  };

  /// Relay chain keeping the heads of parachains
  class ParachainsSourceClient {
   public:
    virtual ~ParachainsSourceClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    virtual CoroOutcome<std::optional<bridge::parachains::ParaHead>> paraHead(
        bridge::parachains::ParaId para_id, const BlockHash &at) = 0;

    virtual CoroOutcome<storage::StateProof> proveParaHeads(
        const std::vector<bridge::parachains::ParaId> &para_ids,
        const BlockHash &at) = 0;
  };

  /// Chain tracking parachain heads of the bridged relay chain
  class ParachainsTargetClient {
   public:
    virtual ~ParachainsTargetClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    virtual CoroOutcome<BlockInfo> bestFinalizedSourceBlock() = 0;

    virtual CoroOutcome<std::optional<bridge::parachains::BestParaHeadHash>>
    bestParaHeadHash(bridge::parachains::ParaId para_id) = 0;

    virtual CoroOutcome<void> submitParachainHeads(
        BlockInfo at_relay_block,
        std::vector<bridge::parachains::ParaHeadUpdate> updates,
        storage::StateProof heads_proof) = 0;
  };

  class RuntimeVersionClient {
   public:
    virtual ~RuntimeVersionClient() = default;

    virtual CoroOutcome<void> reconnect() = 0;

    virtual CoroOutcome<primitives::RuntimeVersion> runtimeVersion() = 0;
  };

}  // namespace trestle::relay
