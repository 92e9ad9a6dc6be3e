/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/messages_proofs.hpp"

#include "bridge/messages/storage_keys.hpp"

namespace trestle::bridge::messages {

  namespace {
    MessageNonce rangeSize(MessageNonce start, MessageNonce end) {
      return DeliveredMessages{.begin = start, .end = end}.totalMessages();
    }
  }  // namespace

  outcome::result<MessagesProof> prepareMessagesProof(
      const storage::InMemoryStorage &state,
      const crypto::Hasher &hasher,
      const primitives::BlockHash &at,
      const LaneId &lane,
      MessageNonce nonces_start,
      MessageNonce nonces_end,
      bool add_outbound_lane_data) {
    std::vector<common::Buffer> keys;
    auto messages_count = rangeSize(nonces_start, nonces_end);
    for (MessageNonce i = 0; i < messages_count; ++i) {
      OUTCOME_TRY(key,
                  storage_keys::messageKey(hasher, lane, nonces_start + i));
      keys.emplace_back(std::move(key));
    }
    if (add_outbound_lane_data) {
      OUTCOME_TRY(key, storage_keys::outboundLaneKey(hasher, lane));
      keys.emplace_back(std::move(key));
    }
    OUTCOME_TRY(storage_proof, storage::prepareStateProof(state, keys, hasher));
    return MessagesProof{
        .bridged_header_hash = at,
        .storage_proof = std::move(storage_proof),
        .lane = lane,
        .nonces_start = nonces_start,
        .nonces_end = nonces_end,
    };
  }

  outcome::result<ProvedLaneMessages> verifyMessagesProof(
      const header_chain::HeaderChainModule &bridged_chain,
      const crypto::Hasher &hasher,
      const MessagesProof &proof,
      MessageNonce messages_count) {
    auto messages_in_proof = rangeSize(proof.nonces_start, proof.nonces_end);
    if (messages_in_proof != messages_count) {
      return MessagesProofError::MESSAGES_COUNT_MISMATCH;
    }

    OUTCOME_TRY(checker,
                bridged_chain.stateProofChecker(proof.bridged_header_hash,
                                                proof.storage_proof));

    ProvedLaneMessages proved;
    proved.messages.reserve(messages_in_proof);
    for (MessageNonce i = 0; i < messages_in_proof; ++i) {
      auto nonce = proof.nonces_start + i;
      OUTCOME_TRY(key, storage_keys::messageKey(hasher, proof.lane, nonce));
      auto raw = checker.readValue(key);
      if (not raw) {
        return MessagesProofError::MISSING_REQUIRED_MESSAGE;
      }
      auto payload = scale::decode<MessagePayload>(*raw);
      if (payload.has_error()) {
        return MessagesProofError::FAILED_TO_DECODE_MESSAGE;
      }
      proved.messages.emplace_back(Message{
          .key = {.lane_id = proof.lane, .nonce = nonce},
          .payload = std::move(payload.value()),
      });
    }

    OUTCOME_TRY(lane_key, storage_keys::outboundLaneKey(hasher, proof.lane));
    if (auto raw = checker.readValue(lane_key)) {
      auto lane_data = scale::decode<OutboundLaneData>(*raw);
      if (lane_data.has_error()) {
        return MessagesProofError::FAILED_TO_DECODE_LANE_STATE;
      }
      proved.lane_state = std::move(lane_data.value());
    }

    if (proved.messages.empty() and not proved.lane_state) {
      return MessagesProofError::EMPTY;
    }
    OUTCOME_TRY(checker.ensureNoUnusedEntries());
    return proved;
  }

  outcome::result<MessagesDeliveryProof> prepareMessagesDeliveryProof(
      const storage::InMemoryStorage &state,
      const crypto::Hasher &hasher,
      const primitives::BlockHash &at,
      const LaneId &lane) {
    OUTCOME_TRY(key, storage_keys::inboundLaneKey(hasher, lane));
    OUTCOME_TRY(storage_proof,
                storage::prepareStateProof(state, {std::move(key)}, hasher));
    return MessagesDeliveryProof{
        .bridged_header_hash = at,
        .storage_proof = std::move(storage_proof),
        .lane = lane,
    };
  }

  outcome::result<InboundLaneData> verifyMessagesDeliveryProof(
      const header_chain::HeaderChainModule &bridged_chain,
      const crypto::Hasher &hasher,
      const MessagesDeliveryProof &proof) {
    OUTCOME_TRY(checker,
                bridged_chain.stateProofChecker(proof.bridged_header_hash,
                                                proof.storage_proof));
    OUTCOME_TRY(key, storage_keys::inboundLaneKey(hasher, proof.lane));
    auto raw = checker.readValue(key);
    if (not raw) {
      return MessagesProofError::MISSING_LANE_STATE;
    }
    auto lane_data = scale::decode<InboundLaneData>(*raw);
    if (lane_data.has_error()) {
      return MessagesProofError::FAILED_TO_DECODE_LANE_STATE;
    }
    OUTCOME_TRY(checker.ensureNoUnusedEntries());
    return std::move(lane_data.value());
  }

}  // namespace trestle::bridge::messages
