/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/types.hpp"

namespace trestle::bridge::messages {

  UnrewardedRelayersState UnrewardedRelayersState::from(
      const InboundLaneData &data) {
    UnrewardedRelayersState state{
        .unrewarded_relayer_entries = data.relayers.size(),
        .last_delivered_nonce = data.lastDeliveredNonce(),
    };
    for (auto &entry : data.relayers) {
      state.total_messages += entry.messages.totalMessages();
    }
    if (not data.relayers.empty()) {
      state.messages_in_oldest_entry =
          data.relayers.front().messages.totalMessages();
    }
    return state;
  }

}  // namespace trestle::bridge::messages
