/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/migration.hpp"

#include <gtest/gtest.h>

#include "bridge/messages/storage_keys.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace trestle::bridge::messages;
using trestle::bridge::AccountId;
using trestle::bridge::messages::storage_keys::kInboundLanes;
using trestle::bridge::messages::storage_keys::kModuleName;
using trestle::bridge::messages::storage_keys::kOutboundLanes;
using trestle::bridge::messages::storage_keys::kStorageVersion;
using trestle::storage::StorageMap;
using trestle::storage::StorageValue;

class MessagesMigrationTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static LaneId lane(uint8_t i) {
    LaneId id;
    id[3] = i;
    return id;
  }

  std::shared_ptr<trestle::crypto::HasherImpl> hasher_ =
      std::make_shared<trestle::crypto::HasherImpl>();
  std::shared_ptr<trestle::storage::InMemoryStorage> storage_ =
      std::make_shared<trestle::storage::InMemoryStorage>();
  StorageMap<LaneId, OutboundLaneDataV0> legacy_outbound_{
      storage_, hasher_, kModuleName, kOutboundLanes};
  StorageMap<LaneId, InboundLaneDataV0> legacy_inbound_{
      storage_, hasher_, kModuleName, kInboundLanes};
  StorageMap<LaneId, OutboundLaneData> outbound_{
      storage_, hasher_, kModuleName, kOutboundLanes};
  StorageMap<LaneId, InboundLaneData> inbound_{
      storage_, hasher_, kModuleName, kInboundLanes};
  StorageValue<uint16_t> version_{
      storage_, hasher_, kModuleName, kStorageVersion};
};

/**
 * @given lanes stored in the layout without lane state
 * @when the migration runs
 * @then every lane is opened with its nonces and relayers kept
 */
TEST_F(MessagesMigrationTest, OpensLegacyLanes) {
  EXPECT_OUTCOME_TRUE_1(legacy_outbound_.put(
      lane(1),
      OutboundLaneDataV0{.oldest_unpruned_nonce = 3,
                         .latest_received_nonce = 5,
                         .latest_generated_nonce = 9}));
  EXPECT_OUTCOME_TRUE_1(legacy_outbound_.put(lane(2), OutboundLaneDataV0{}));
  AccountId relayer;
  relayer[0] = 7;
  EXPECT_OUTCOME_TRUE_1(legacy_inbound_.put(
      lane(1),
      InboundLaneDataV0{
          .relayers = {UnrewardedRelayer{
              .relayer = relayer, .messages = {.begin = 4, .end = 6}}},
          .last_confirmed_nonce = 3}));

  MessagesMigrationV0ToV1 migration{storage_, hasher_};
  EXPECT_OUTCOME_TRUE(result, migration.run());
  EXPECT_TRUE(result.applied);
  EXPECT_EQ(result.outbound_lanes, 2);
  EXPECT_EQ(result.inbound_lanes, 1);

  EXPECT_OUTCOME_TRUE(outbound, outbound_.get(lane(1)));
  EXPECT_EQ(outbound,
            (OutboundLaneData{.oldest_unpruned_nonce = 3,
                              .latest_received_nonce = 5,
                              .latest_generated_nonce = 9,
                              .state = LaneState::OPENED}));
  EXPECT_OUTCOME_TRUE(inbound, inbound_.get(lane(1)));
  EXPECT_EQ(inbound.state, LaneState::OPENED);
  EXPECT_EQ(inbound.last_confirmed_nonce, 3);
  ASSERT_EQ(inbound.relayers.size(), 1);
  EXPECT_EQ(inbound.relayers.front().relayer, relayer);
  EXPECT_EQ(inbound.lastDeliveredNonce(), 6);

  EXPECT_OUTCOME_TRUE(version, version_.get());
  EXPECT_EQ(version, MessagesMigrationV0ToV1::kToVersion);
}

/**
 * @given a migrated storage
 * @when the migration runs again
 * @then nothing is changed
 */
TEST_F(MessagesMigrationTest, RunsOnce) {
  EXPECT_OUTCOME_TRUE_1(legacy_outbound_.put(lane(1), OutboundLaneDataV0{}));
  MessagesMigrationV0ToV1 migration{storage_, hasher_};
  EXPECT_OUTCOME_TRUE_1(migration.run());
  EXPECT_OUTCOME_TRUE_1(outbound_.put(
      lane(1), OutboundLaneData{.state = LaneState::CLOSED}));

  EXPECT_OUTCOME_TRUE(again, migration.run());
  EXPECT_FALSE(again.applied);
  EXPECT_OUTCOME_TRUE(outbound, outbound_.get(lane(1)));
  EXPECT_EQ(outbound.state, LaneState::CLOSED);
}
