/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/dev_clients.hpp"

#include "bridge/header_chain/submit_finality_proof_filter.hpp"
#include "bridge/messages/messages_proofs.hpp"
#include "bridge/messages/storage_keys.hpp"
#include "bridge/parachains/para_head_admission_filter.hpp"
#include "relay/client_error.hpp"

namespace trestle::devnet {

  using bridge::messages::InboundLaneData;
  using bridge::messages::InboundLanesMap;
  using bridge::messages::MessagesError;
  using bridge::messages::OutboundLaneData;
  using bridge::messages::OutboundLanesMap;
  using relay::ClientError;
  namespace storage_keys = bridge::messages::storage_keys;

  DevClient::DevClient(std::shared_ptr<DevChain> chain)
      : chain_{std::move(chain)} {
    BOOST_ASSERT(chain_ != nullptr);
  }

  outcome::result<void> DevClient::ensureConnected() const {
    if (not chain_->connected()) {
      return ClientError::CONNECTION_LOST;
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<storage::InMemoryStorage>> DevClient::stateAt(
      const primitives::BlockHash &hash) const {
    auto state = chain_->stateAt(hash);
    if (state == nullptr) {
      return ClientError::UNKNOWN_BLOCK;
    }
    return state;
  }

  outcome::result<primitives::BlockInfo> DevClient::bestBridgedBlock() const {
    OUTCOME_TRY(best, chain_->headerChain()->bestFinalized());
    if (not best) {
      return bridge::header_chain::HeaderChainError::NOT_INITIALIZED;
    }
    return *best;
  }

  DevFinalitySourceClient::DevFinalitySourceClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevFinalitySourceClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<primitives::BlockNumber>
  DevFinalitySourceClient::bestFinalizedBlockNumber() {
    CO_TRY(ensureConnected());
    co_return chain_->bestFinalized().number;
  }

  CoroOutcome<relay::HeaderAndJustification>
  DevFinalitySourceClient::headerAndJustification(
      primitives::BlockNumber number) {
    CO_TRY(ensureConnected());
    auto block = chain_->block(number);
    if (not block) {
      co_return ClientError::UNKNOWN_BLOCK;
    }
    co_return relay::HeaderAndJustification{
        .header = std::move(block->header),
        .justification = std::move(block->justification),
    };
  }

  DevFinalityTargetClient::DevFinalityTargetClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevFinalityTargetClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<primitives::BlockInfo>
  DevFinalityTargetClient::bestFinalizedSourceBlock() {
    CO_TRY(ensureConnected());
    co_return bestBridgedBlock();
  }

  CoroOutcome<primitives::AuthoritySet>
  DevFinalityTargetClient::currentAuthoritySet() {
    CO_TRY(ensureConnected());
    co_return chain_->headerChain()->currentAuthoritySet();
  }

  CoroOutcome<void> DevFinalityTargetClient::submitFinalityProof(
      primitives::BlockHeader header,
      consensus::grandpa::GrandpaJustification justification,
      primitives::AuthoritySetId current_set_id) {
    CO_TRY(ensureConnected());
    bridge::header_chain::SubmitFinalityProofCall call{
        .finality_target = std::move(header),
        .justification = std::move(justification),
        .current_set_id = current_set_id,
    };
    bridge::header_chain::SubmitFinalityProofFilter filter{
        chain_->headerChain()};
    CO_TRY(filter.validate(call));
    CO_TRY(chain_->headerChain()->submitFinalityProof(
        std::move(call.finality_target),
        call.justification,
        call.current_set_id));
    co_return outcome::success();
  }

  DevMessagesSourceClient::DevMessagesSourceClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevMessagesSourceClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<primitives::BlockInfo>
  DevMessagesSourceClient::bestFinalizedTargetBlock() {
    CO_TRY(ensureConnected());
    co_return bestBridgedBlock();
  }

  CoroOutcome<OutboundLaneData> DevMessagesSourceClient::outboundLaneData(
      const bridge::messages::LaneId &lane,
      std::optional<primitives::BlockHash> at) {
    CO_TRY(ensureConnected());
    std::optional<OutboundLaneData> data;
    if (at) {
      auto state = CO_TRY(stateAt(*at));
      OutboundLanesMap lanes{state,
                             chain_->hasher(),
                             storage_keys::kModuleName,
                             storage_keys::kOutboundLanes};
      data = CO_TRY(lanes.tryGet(lane));
    } else {
      data = CO_TRY(chain_->messages()->outboundLaneData(lane));
    }
    if (not data) {
      co_return MessagesError::UNKNOWN_LANE;
    }
    co_return std::move(*data);
  }

  CoroOutcome<bridge::messages::MessagesProof>
  DevMessagesSourceClient::proveMessages(const bridge::messages::LaneId &lane,
                                         const primitives::BlockHash &at,
                                         bridge::messages::MessageNonce begin,
                                         bridge::messages::MessageNonce end,
                                         bool add_outbound_lane_data) {
    CO_TRY(ensureConnected());
    auto state = CO_TRY(stateAt(at));
    co_return bridge::messages::prepareMessagesProof(*state,
                                                     *chain_->hasher(),
                                                     at,
                                                     lane,
                                                     begin,
                                                     end,
                                                     add_outbound_lane_data);
  }

  CoroOutcome<void> DevMessagesSourceClient::submitMessagesDeliveryProof(
      const bridge::AccountId &relayer,
      bridge::messages::MessagesDeliveryProof proof,
      bridge::messages::UnrewardedRelayersState relayers_state) {
    CO_TRY(ensureConnected());
    CO_TRY(chain_->messages()->receiveMessagesDeliveryProof(
        relayer, proof, relayers_state));
    co_return outcome::success();
  }

  DevMessagesTargetClient::DevMessagesTargetClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevMessagesTargetClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<primitives::BlockInfo>
  DevMessagesTargetClient::bestFinalizedSourceBlock() {
    CO_TRY(ensureConnected());
    co_return bestBridgedBlock();
  }

  CoroOutcome<InboundLaneData> DevMessagesTargetClient::inboundLaneData(
      const bridge::messages::LaneId &lane,
      std::optional<primitives::BlockHash> at) {
    CO_TRY(ensureConnected());
    std::optional<InboundLaneData> data;
    if (at) {
      auto state = CO_TRY(stateAt(*at));
      InboundLanesMap lanes{state,
                            chain_->hasher(),
                            storage_keys::kModuleName,
                            storage_keys::kInboundLanes};
      data = CO_TRY(lanes.tryGet(lane));
    } else {
      data = CO_TRY(chain_->messages()->inboundLaneData(lane));
    }
    if (not data) {
      co_return MessagesError::UNKNOWN_LANE;
    }
    co_return std::move(*data);
  }

  CoroOutcome<bridge::messages::MessagesDeliveryProof>
  DevMessagesTargetClient::proveMessagesDelivery(
      const bridge::messages::LaneId &lane, const primitives::BlockHash &at) {
    CO_TRY(ensureConnected());
    auto state = CO_TRY(stateAt(at));
    co_return bridge::messages::prepareMessagesDeliveryProof(
        *state, *chain_->hasher(), at, lane);
  }

  CoroOutcome<void> DevMessagesTargetClient::submitMessagesProof(
      const bridge::AccountId &relayer,
      bridge::messages::MessagesProof proof,
      bridge::messages::MessageNonce messages_count,
      bridge::messages::Weight dispatch_weight) {
    CO_TRY(ensureConnected());
    CO_TRY(chain_->messages()->receiveMessagesProof(
        relayer, proof, messages_count, dispatch_weight));
    co_return outcome::success();
  }

  DevParachainsSourceClient::DevParachainsSourceClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevParachainsSourceClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<std::optional<bridge::parachains::ParaHead>>
  DevParachainsSourceClient::paraHead(bridge::parachains::ParaId para_id,
                                      const primitives::BlockHash &at) {
    CO_TRY(ensureConnected());
    auto state = CO_TRY(stateAt(at));
    auto key = CO_TRY(
        bridge::parachains::ParasRegistry::headKey(*chain_->hasher(), para_id));
    auto raw = CO_TRY(state->tryGet(key));
    if (not raw) {
      co_return std::nullopt;
    }
    auto head = CO_TRY(scale::decode<bridge::parachains::ParaHead>(*raw));
    co_return std::move(head);
  }

  CoroOutcome<storage::StateProof> DevParachainsSourceClient::proveParaHeads(
      const std::vector<bridge::parachains::ParaId> &para_ids,
      const primitives::BlockHash &at) {
    CO_TRY(ensureConnected());
    auto state = CO_TRY(stateAt(at));
    std::vector<common::Buffer> keys;
    for (auto para_id : para_ids) {
      auto key = CO_TRY(bridge::parachains::ParasRegistry::headKey(
          *chain_->hasher(), para_id));
      keys.emplace_back(std::move(key));
    }
    co_return storage::prepareStateProof(*state, keys, *chain_->hasher());
  }

  DevParachainsTargetClient::DevParachainsTargetClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevParachainsTargetClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<primitives::BlockInfo>
  DevParachainsTargetClient::bestFinalizedSourceBlock() {
    CO_TRY(ensureConnected());
    co_return bestBridgedBlock();
  }

  CoroOutcome<std::optional<bridge::parachains::BestParaHeadHash>>
  DevParachainsTargetClient::bestParaHeadHash(
      bridge::parachains::ParaId para_id) {
    CO_TRY(ensureConnected());
    auto info = CO_TRY(chain_->parachains()->bestParaHead(para_id));
    if (not info) {
      co_return std::nullopt;
    }
    co_return info->best_head_hash;
  }

  CoroOutcome<void> DevParachainsTargetClient::submitParachainHeads(
      primitives::BlockInfo at_relay_block,
      std::vector<bridge::parachains::ParaHeadUpdate> updates,
      storage::StateProof heads_proof) {
    CO_TRY(ensureConnected());
    bridge::parachains::SubmitParachainHeadsCall call{
        .at_relay_block = at_relay_block,
        .parachains = std::move(updates),
        .heads_proof = std::move(heads_proof),
    };
    bridge::parachains::ParaHeadAdmissionFilter filter{chain_->parachains()};
    CO_TRY(filter.validate(call));
    CO_TRY(chain_->parachains()->submitParachainHeads(
        call.at_relay_block, call.parachains, call.heads_proof));
    co_return outcome::success();
  }

  DevRuntimeVersionClient::DevRuntimeVersionClient(
      std::shared_ptr<DevChain> chain)
      : DevClient{std::move(chain)} {}

  CoroOutcome<void> DevRuntimeVersionClient::reconnect() {
    co_return ensureConnected();
  }

  CoroOutcome<primitives::RuntimeVersion>
  DevRuntimeVersionClient::runtimeVersion() {
    CO_TRY(ensureConnected());
    co_return chain_->runtimeVersion();
  }

}  // namespace trestle::devnet
