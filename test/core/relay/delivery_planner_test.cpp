/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/message_lane_loop.hpp"

#include <gtest/gtest.h>

using trestle::bridge::AccountId;
using trestle::bridge::messages::DeliveredMessages;
using trestle::bridge::messages::LaneState;
using trestle::bridge::messages::UnrewardedRelayer;
using trestle::relay::DeliveryPlan;
using trestle::relay::InboundLaneData;
using trestle::relay::MessageLaneParams;
using trestle::relay::MessageNonce;
using trestle::relay::OutboundLaneData;
using trestle::relay::planDelivery;

class DeliveryPlannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    params_.relayer = account(1);
    params_.max_messages_in_tx = 16;
    params_.max_unrewarded_relayer_entries = 4;
    params_.max_unconfirmed_messages = 128;
  }

  static AccountId account(uint8_t i) {
    AccountId id;
    id[0] = i;
    return id;
  }

  /// Inbound lane with messages `begin..=end` delivered by the relayer
  void delivered(uint8_t relayer, MessageNonce begin, MessageNonce end) {
    inbound_.relayers.push_back(UnrewardedRelayer{
        .relayer = account(relayer),
        .messages = {.begin = begin, .end = end},
    });
  }

  std::optional<DeliveryPlan> plan() const {
    return planDelivery(outbound_, inbound_, params_);
  }

  static DeliveryPlan messages(MessageNonce begin,
                               MessageNonce end,
                               bool add_outbound_lane_data = false) {
    return {.nonces = {.begin = begin, .end = end},
            .add_outbound_lane_data = add_outbound_lane_data};
  }

  OutboundLaneData outbound_;
  InboundLaneData inbound_;
  MessageLaneParams params_;
};

/**
 * @given lanes in sync
 * @when planning a delivery
 * @then there is nothing to do
 */
TEST_F(DeliveryPlannerTest, NothingToDeliver) {
  outbound_.latest_generated_nonce = 2;
  delivered(1, 1, 2);
  EXPECT_EQ(plan(), std::nullopt);
}

/**
 * @given 20 queued messages and 16 messages per transaction
 * @when planning a delivery
 * @then the first 16 are selected
 */
TEST_F(DeliveryPlannerTest, LimitedByTransactionSize) {
  outbound_.latest_generated_nonce = 20;
  EXPECT_EQ(plan(), messages(1, 16));

  outbound_.latest_generated_nonce = 5;
  EXPECT_EQ(plan(), messages(1, 5));
}

/**
 * @given delivered messages which the source has confirmed
 * @when the target doesn't know the confirmation yet
 * @then the outbound lane state is delivered without messages
 */
TEST_F(DeliveryPlannerTest, DeliversConfirmationsOnly) {
  outbound_.latest_generated_nonce = 3;
  outbound_.latest_received_nonce = 3;
  delivered(2, 1, 3);
  auto planned = plan();
  ASSERT_TRUE(planned.has_value());
  EXPECT_EQ(planned->nonces.totalMessages(), 0);
  EXPECT_TRUE(planned->add_outbound_lane_data);
}

/**
 * @given a closing outbound lane and an opened inbound one
 * @when planning a delivery
 * @then the lane state is delivered
 */
TEST_F(DeliveryPlannerTest, DeliversLaneState) {
  outbound_.state = LaneState::CLOSING;
  auto planned = plan();
  ASSERT_TRUE(planned.has_value());
  EXPECT_TRUE(planned->add_outbound_lane_data);
}

/**
 * @given the relayers queue of the target lane is full
 * @when planning a delivery
 * @then messages wait until the source confirmation frees the queue
 */
TEST_F(DeliveryPlannerTest, FullRelayersQueue) {
  params_.max_unrewarded_relayer_entries = 2;
  outbound_.latest_generated_nonce = 5;
  delivered(2, 1, 1);
  delivered(3, 2, 2);
  EXPECT_EQ(plan(), std::nullopt);

  outbound_.latest_received_nonce = 2;
  EXPECT_EQ(plan(), messages(3, 5, true));
}

/**
 * @given one free entry in the relayers queue of the target lane
 * @when another relayer owns the last entry
 * @then only one message fits, otherwise the entry is extended
 */
TEST_F(DeliveryPlannerTest, LastRelayersEntry) {
  params_.max_unrewarded_relayer_entries = 2;
  outbound_.latest_generated_nonce = 5;
  delivered(2, 1, 1);
  EXPECT_EQ(plan(), messages(2, 2));

  params_.relayer = account(2);
  EXPECT_EQ(plan(), messages(2, 5));
}

/**
 * @given 3 unconfirmed messages and a limit of 4
 * @when planning a delivery
 * @then only one more message is selected
 */
TEST_F(DeliveryPlannerTest, UnconfirmedMessagesLimit) {
  params_.max_unconfirmed_messages = 4;
  outbound_.latest_generated_nonce = 10;
  delivered(1, 1, 3);
  EXPECT_EQ(plan(), messages(4, 4));
}
