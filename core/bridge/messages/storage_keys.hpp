/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/messages/types.hpp"
#include "storage/storage_item.hpp"

/**
 * Storage keys of the messages module, shared by the module and by the
 * proofs reading its storage at the bridged chain
 */
namespace trestle::bridge::messages::storage_keys {

  constexpr std::string_view kModuleName = "BridgeMessages";
  constexpr std::string_view kOutboundLanes = "OutboundLanes";
  constexpr std::string_view kInboundLanes = "InboundLanes";
  constexpr std::string_view kOutboundMessages = "OutboundMessages";
  constexpr std::string_view kOperatingMode = "PalletOperatingMode";
  constexpr std::string_view kStorageVersion = ":__STORAGE_VERSION__:";

  inline outcome::result<common::Buffer> outboundLaneKey(
      const crypto::Hasher &hasher, const LaneId &lane) {
    return storage::storageMapKey(
        hasher, storage::storagePrefix(hasher, kModuleName, kOutboundLanes),
        lane);
  }

  inline outcome::result<common::Buffer> inboundLaneKey(
      const crypto::Hasher &hasher, const LaneId &lane) {
    return storage::storageMapKey(
        hasher, storage::storagePrefix(hasher, kModuleName, kInboundLanes),
        lane);
  }

  inline outcome::result<common::Buffer> messageKey(
      const crypto::Hasher &hasher, const LaneId &lane, MessageNonce nonce) {
    return storage::storageMapKey(
        hasher,
        storage::storagePrefix(hasher, kModuleName, kOutboundMessages),
        MessageKey{.lane_id = lane, .nonce = nonce});
  }

}  // namespace trestle::bridge::messages::storage_keys
