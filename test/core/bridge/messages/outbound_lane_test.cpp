/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/messages/outbound_lane.hpp"

#include <gtest/gtest.h>

#include "bridge/messages/runtime_lane_storage.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/outcome.hpp"

using trestle::bridge::AccountId;
using trestle::bridge::messages::DeliveredMessages;
using trestle::bridge::messages::LaneError;
using trestle::bridge::messages::LaneId;
using trestle::bridge::messages::LaneState;
using trestle::bridge::messages::MessageNonce;
using trestle::bridge::messages::OutboundLane;
using trestle::bridge::messages::OutboundLaneData;
using trestle::bridge::messages::OutboundLanesMap;
using trestle::bridge::messages::OutboundMessagesMap;
using trestle::bridge::messages::RuntimeOutboundLaneStorage;
using trestle::bridge::messages::UnrewardedRelayer;
using trestle::bridge::messages::UnrewardedRelayers;
using trestle::common::Buffer;

class OutboundLaneTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(lanes_.put(lane_id_, OutboundLaneData{}).has_value());
  }

  static AccountId account(uint8_t i) {
    AccountId id;
    id[0] = i;
    return id;
  }

  static UnrewardedRelayer entry(uint8_t relayer,
                                 MessageNonce begin,
                                 MessageNonce end) {
    return {.relayer = account(relayer),
            .messages = {.begin = begin, .end = end}};
  }

  void sendMessages(size_t count) {
    for (size_t i = 0; i < count; ++i) {
      ASSERT_TRUE(
          lane_.sendMessage(Buffer{static_cast<uint8_t>(i)}).has_value());
    }
  }

  std::shared_ptr<trestle::crypto::HasherImpl> hasher_ =
      std::make_shared<trestle::crypto::HasherImpl>();
  std::shared_ptr<trestle::storage::InMemoryStorage> storage_ =
      std::make_shared<trestle::storage::InMemoryStorage>();
  OutboundLanesMap lanes_{storage_, hasher_, "Test", "OutboundLanes"};
  OutboundMessagesMap messages_{storage_, hasher_, "Test", "OutboundMessages"};
  LaneId lane_id_;
  RuntimeOutboundLaneStorage lane_storage_{lane_id_, lanes_, messages_};
  OutboundLane lane_{lane_storage_};
};

/**
 * @given an empty lane
 * @when sending 2 messages
 * @then they get consecutive nonces and are stored
 */
TEST_F(OutboundLaneTest, SendMessage) {
  EXPECT_OUTCOME_TRUE(first, lane_.sendMessage(Buffer{1}));
  EXPECT_OUTCOME_TRUE(second, lane_.sendMessage(Buffer{2}));
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 2);

  EXPECT_OUTCOME_TRUE(data, lane_.data());
  EXPECT_EQ(data.latest_generated_nonce, 2);
  EXPECT_EQ(data.queuedMessages(), (DeliveredMessages{.begin = 1, .end = 2}));
  EXPECT_OUTCOME_TRUE(stored, lane_storage_.message(2));
  EXPECT_EQ(stored, std::optional<Buffer>{Buffer{2}});
}

/**
 * @given 3 sent messages
 * @when the delivery of all of them is confirmed by 2 relayers entries
 * @then the confirmed range is returned and the queue is empty
 */
TEST_F(OutboundLaneTest, ConfirmDelivery) {
  sendMessages(3);
  EXPECT_OUTCOME_TRUE(
      confirmed,
      lane_.confirmDelivery(
          3, 3, UnrewardedRelayers{entry(1, 1, 2), entry(2, 3, 3)}));
  ASSERT_TRUE(confirmed.has_value());
  EXPECT_EQ(*confirmed, (DeliveredMessages{.begin = 1, .end = 3}));
  EXPECT_OUTCOME_TRUE(data, lane_.data());
  EXPECT_EQ(data.latest_received_nonce, 3);
  EXPECT_EQ(data.queuedMessages().totalMessages(), 0);

  EXPECT_OUTCOME_TRUE(again, lane_.confirmDelivery(3, 3, {}));
  EXPECT_FALSE(again.has_value());
}

/**
 * @given 3 sent messages
 * @when confirming more messages than sent or than allowed
 * @then the confirmation is rejected
 */
TEST_F(OutboundLaneTest, RejectsExcessiveConfirmation) {
  sendMessages(3);
  EXPECT_EC(lane_.confirmDelivery(10, 5, {entry(1, 1, 5)}),
            LaneError::FAILED_TO_CONFIRM_FUTURE_MESSAGES);
  EXPECT_EC(lane_.confirmDelivery(2, 3, {entry(1, 1, 3)}),
            LaneError::TRYING_TO_CONFIRM_MORE_MESSAGES_THAN_EXPECTED);
  EXPECT_OUTCOME_TRUE(data, lane_.data());
  EXPECT_EQ(data.latest_received_nonce, 0);
}

/**
 * @given 3 sent messages
 * @when the declared relayers entries are malformed
 * @then every malformed form is rejected
 */
TEST_F(OutboundLaneTest, RejectsMalformedRelayers) {
  sendMessages(3);
  EXPECT_EC(lane_.confirmDelivery(3, 3, {entry(1, 1, 2), entry(2, 4, 3)}),
            LaneError::EMPTY_UNREWARDED_RELAYER_ENTRY);
  EXPECT_EC(lane_.confirmDelivery(3, 3, {entry(1, 1, 1), entry(2, 3, 3)}),
            LaneError::NON_CONSECUTIVE_UNREWARDED_RELAYER_ENTRIES);
  EXPECT_EC(lane_.confirmDelivery(3, 2, {entry(1, 1, 3)}),
            LaneError::FAILED_TO_CONFIRM_FUTURE_MESSAGES);
}

/**
 * @given 3 confirmed messages of 4 sent
 * @when pruning at most 2 messages twice
 * @then 2 and then 1 messages are removed from the storage
 */
TEST_F(OutboundLaneTest, PruneMessages) {
  sendMessages(4);
  EXPECT_OUTCOME_TRUE_1(lane_.confirmDelivery(3, 3, {entry(1, 1, 3)}));

  EXPECT_OUTCOME_TRUE(first, lane_.pruneMessages(2));
  EXPECT_EQ(first, 2);
  EXPECT_OUTCOME_TRUE(second, lane_.pruneMessages(2));
  EXPECT_EQ(second, 1);

  EXPECT_OUTCOME_TRUE(data, lane_.data());
  EXPECT_EQ(data.oldest_unpruned_nonce, 4);
  EXPECT_OUTCOME_TRUE(pruned, lane_storage_.message(3));
  EXPECT_FALSE(pruned.has_value());
  EXPECT_OUTCOME_TRUE(kept, lane_storage_.message(4));
  EXPECT_TRUE(kept.has_value());
}

/**
 * @given an opened lane
 * @when closing it and then trying to reopen
 * @then the state only moves forward
 */
TEST_F(OutboundLaneTest, StateMovesForward) {
  EXPECT_OUTCOME_TRUE_1(lane_.setState(LaneState::CLOSING));
  EXPECT_OUTCOME_TRUE_1(lane_.setState(LaneState::OPENED));
  EXPECT_OUTCOME_TRUE(data, lane_.data());
  EXPECT_EQ(data.state, LaneState::CLOSING);
}
