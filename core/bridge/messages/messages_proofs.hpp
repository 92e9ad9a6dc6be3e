/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/header_chain/header_chain_module.hpp"
#include "bridge/messages/messages_error.hpp"
#include "bridge/messages/types.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace trestle::bridge::messages {

  /**
   * Proves messages of the outbound lane in the inclusive nonces range,
   * optionally with the lane data. Made at the source chain.
   * @param state source chain state at the `at` block
   */
  outcome::result<MessagesProof> prepareMessagesProof(
      const storage::InMemoryStorage &state,
      const crypto::Hasher &hasher,
      const primitives::BlockHash &at,
      const LaneId &lane,
      MessageNonce nonces_start,
      MessageNonce nonces_end,
      bool add_outbound_lane_data);

  /**
   * Reads messages from a proof made at a finalized header of the source
   * chain, imported by the header chain
   * @param messages_count number of messages the relayer declared
   */
  outcome::result<ProvedLaneMessages> verifyMessagesProof(
      const header_chain::HeaderChainModule &bridged_chain,
      const crypto::Hasher &hasher,
      const MessagesProof &proof,
      MessageNonce messages_count);

  /**
   * Proves inbound lane data. Made at the target chain.
   */
  outcome::result<MessagesDeliveryProof> prepareMessagesDeliveryProof(
      const storage::InMemoryStorage &state,
      const crypto::Hasher &hasher,
      const primitives::BlockHash &at,
      const LaneId &lane);

  outcome::result<InboundLaneData> verifyMessagesDeliveryProof(
      const header_chain::HeaderChainModule &bridged_chain,
      const crypto::Hasher &hasher,
      const MessagesDeliveryProof &proof);

}  // namespace trestle::bridge::messages
