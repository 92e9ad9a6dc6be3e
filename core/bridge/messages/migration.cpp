/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/migration.hpp"

#include "bridge/messages/storage_keys.hpp"

namespace trestle::bridge::messages {

  using storage_keys::kInboundLanes;
  using storage_keys::kModuleName;
  using storage_keys::kOutboundLanes;

  MessagesMigrationV0ToV1::MessagesMigrationV0ToV1(
      std::shared_ptr<storage::BufferStorage> storage,
      std::shared_ptr<crypto::Hasher> hasher)
      : legacy_outbound_{storage, hasher, kModuleName, kOutboundLanes},
        legacy_inbound_{storage, hasher, kModuleName, kInboundLanes},
        outbound_{storage, hasher, kModuleName, kOutboundLanes},
        inbound_{storage, hasher, kModuleName, kInboundLanes},
        storage_version_{
            storage, hasher, kModuleName, storage_keys::kStorageVersion},
        logger_{log::createLogger("MessagesMigration", "messages")} {}

  outcome::result<MigrationOutcome> MessagesMigrationV0ToV1::run() {
    OUTCOME_TRY(version, storage_version_.getOrDefault());
    if (version != kFromVersion) {
      SL_DEBUG(logger_,
               "Storage version is {}, migration to {} is skipped",
               version,
               kToVersion);
      return MigrationOutcome{};
    }

    MigrationOutcome result{.applied = true};

    OUTCOME_TRY(outbound_lanes, legacy_outbound_.keys());
    for (auto &lane : outbound_lanes) {
      OUTCOME_TRY(legacy, legacy_outbound_.get(lane));
      OUTCOME_TRY(outbound_.put(
          lane,
          OutboundLaneData{
              .oldest_unpruned_nonce = legacy.oldest_unpruned_nonce,
              .latest_received_nonce = legacy.latest_received_nonce,
              .latest_generated_nonce = legacy.latest_generated_nonce,
              .state = LaneState::OPENED,
          }));
      ++result.outbound_lanes;
    }

    OUTCOME_TRY(inbound_lanes, legacy_inbound_.keys());
    for (auto &lane : inbound_lanes) {
      OUTCOME_TRY(legacy, legacy_inbound_.get(lane));
      OUTCOME_TRY(inbound_.put(
          lane,
          InboundLaneData{
              .relayers = std::move(legacy.relayers),
              .last_confirmed_nonce = legacy.last_confirmed_nonce,
              .state = LaneState::OPENED,
          }));
      ++result.inbound_lanes;
    }

    OUTCOME_TRY(storage_version_.put(kToVersion));
    SL_INFO(logger_,
            "Messages storage is migrated to version {}: "
            "{} outbound and {} inbound lanes",
            kToVersion,
            result.outbound_lanes,
            result.inbound_lanes);
    return result;
  }

}  // namespace trestle::bridge::messages
