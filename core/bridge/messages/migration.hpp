/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/types.hpp"
#include "log/logger.hpp"
#include "storage/storage_item.hpp"

namespace trestle::bridge::messages {

  /// Lane data as stored before lanes had a state
  struct OutboundLaneDataV0 {
    MessageNonce oldest_unpruned_nonce = 1;
    MessageNonce latest_received_nonce = 0;
    MessageNonce latest_generated_nonce = 0;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const OutboundLaneDataV0 &v) {
    return s << v.oldest_unpruned_nonce << v.latest_received_nonce
             << v.latest_generated_nonce;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, OutboundLaneDataV0 &v) {
    return s >> v.oldest_unpruned_nonce >> v.latest_received_nonce
        >> v.latest_generated_nonce;
  }

  struct InboundLaneDataV0 {
    UnrewardedRelayers relayers;
    MessageNonce last_confirmed_nonce = 0;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const InboundLaneDataV0 &v) {
    encodeRelayers(s, v.relayers);
    return s << v.last_confirmed_nonce;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, InboundLaneDataV0 &v) {
    decodeRelayers(s, v.relayers);
    return s >> v.last_confirmed_nonce;
  }

  struct MigrationOutcome {
    /// False if the storage was already at the target version
    bool applied = false;
    size_t outbound_lanes = 0;
    size_t inbound_lanes = 0;
  };

  /**
   * Upgrades storage of the messages module from version 0 to version 1:
   * every stored lane gets the OPENED state. Running it again is a no-op.
   */
  class MessagesMigrationV0ToV1 {
   public:
    static constexpr uint16_t kFromVersion = 0;
    static constexpr uint16_t kToVersion = 1;

    MessagesMigrationV0ToV1(std::shared_ptr<storage::BufferStorage> storage,
                            std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<MigrationOutcome> run();

   private:
    storage::StorageMap<LaneId, OutboundLaneDataV0> legacy_outbound_;
    storage::StorageMap<LaneId, InboundLaneDataV0> legacy_inbound_;
    storage::StorageMap<LaneId, OutboundLaneData> outbound_;
    storage::StorageMap<LaneId, InboundLaneData> inbound_;
    storage::StorageValue<uint16_t> storage_version_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::messages
