/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/dev_network.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "scale/trestle_scale.hpp"
#include "storage/state_proof/state_proof.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using trestle::bridge::messages::LaneId;
using trestle::bridge::messages::LaneState;
using trestle::bridge::parachains::ParaId;
using trestle::devnet::DevNetwork;
using trestle::devnet::DevNetworkConfig;
using trestle::primitives::BlockNumber;

class DevNetworkTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static constexpr ParaId kParaId = 2000;

  void SetUp() override {
    lane_[3] = 1;
    config_.justification_period = 2;
    config_.lanes = {lane_};
    config_.parachains = {kParaId};
  }

  void initialize() {
    network_ = std::make_shared<DevNetwork>(config_, hasher_, ed25519_);
    EXPECT_OUTCOME_TRUE_1(network_->initialize());
  }

  void produceBlocks(size_t count) {
    for (size_t i = 0; i < count; ++i) {
      EXPECT_OUTCOME_TRUE_1(network_->produceBlocks());
    }
  }

  std::shared_ptr<trestle::crypto::HasherImpl> hasher_ =
      std::make_shared<trestle::crypto::HasherImpl>();
  std::shared_ptr<trestle::crypto::Ed25519ProviderImpl> ed25519_ =
      std::make_shared<trestle::crypto::Ed25519ProviderImpl>();
  LaneId lane_;
  DevNetworkConfig config_;
  std::shared_ptr<DevNetwork> network_;
};

/**
 * @given a development network
 * @when it is initialized
 * @then each chain tracks the genesis of the other one and lanes are open
 */
TEST_F(DevNetworkTest, Initialize) {
  initialize();
  auto &source = network_->source();
  auto &target = network_->target();

  EXPECT_OUTCOME_TRUE(source_at_target, target->headerChain()->bestFinalized());
  EXPECT_EQ(source_at_target, source->bestFinalized());
  EXPECT_OUTCOME_TRUE(target_at_source, source->headerChain()->bestFinalized());
  EXPECT_EQ(target_at_source, target->bestFinalized());

  EXPECT_OUTCOME_TRUE(outbound, source->messages()->outboundLaneData(lane_));
  ASSERT_TRUE(outbound.has_value());
  EXPECT_EQ(outbound->state, LaneState::OPENED);
  EXPECT_OUTCOME_TRUE(inbound, target->messages()->inboundLaneData(lane_));
  ASSERT_TRUE(inbound.has_value());
  EXPECT_EQ(inbound->state, LaneState::OPENED);
}

/**
 * @given a justification period of 2
 * @when 5 blocks are produced
 * @then even blocks are justified and every block commits to its state
 */
TEST_F(DevNetworkTest, ProducesJustifiedBlocks) {
  initialize();
  produceBlocks(5);
  auto &source = network_->source();
  EXPECT_EQ(source->bestNumber(), 5);
  EXPECT_EQ(source->bestFinalized().number, 4);

  for (BlockNumber number = 1; number <= 5; ++number) {
    auto block = source->block(number);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->justification.has_value(), number % 2 == 0);
    auto state = source->stateAt(block->header.hash());
    ASSERT_NE(state, nullptr);
    EXPECT_OUTCOME_TRUE(root, trestle::storage::stateRoot(*state, *hasher_));
    EXPECT_EQ(root, block->header.state_root);
  }
  EXPECT_FALSE(source->block(6).has_value());
}

/**
 * @given a parachain of the source chain
 * @when blocks are produced
 * @then the head stored at each block encodes the number of the block
 */
TEST_F(DevNetworkTest, AdvancesParachainHeads) {
  initialize();
  produceBlocks(3);
  EXPECT_OUTCOME_TRUE(head,
                      network_->source()->parasRegistry()->head(kParaId));
  EXPECT_OUTCOME_TRUE(expected,
                      trestle::scale::encode(kParaId, BlockNumber{3}));
  EXPECT_EQ(head, std::optional{expected});
}

/**
 * @given an authority set change period of 2
 * @when the second block is produced
 * @then the next authority set is enacted
 */
TEST_F(DevNetworkTest, ChangesAuthoritySet) {
  config_.authority_set_change_period = 2;
  initialize();
  produceBlocks(2);
  EXPECT_OUTCOME_TRUE(data, network_->source()->initializationData());
  EXPECT_EQ(data.set_id, 1);
  EXPECT_EQ(data.header.number, 2);
}

/**
 * @given a target runtime upgrade scheduled at block 2
 * @when blocks are produced
 * @then the target spec version is bumped at that block
 */
TEST_F(DevNetworkTest, UpgradesTargetRuntime) {
  config_.target_runtime_upgrade_at = 2;
  initialize();
  produceBlocks(1);
  EXPECT_EQ(network_->target()->runtimeVersion().spec_version, 1);
  produceBlocks(1);
  EXPECT_EQ(network_->target()->runtimeVersion().spec_version, 2);
  EXPECT_EQ(network_->source()->runtimeVersion().spec_version, 1);
}

/**
 * @given a started network with short block time and message interval
 * @when shutdown is requested
 * @then block production and message generation stop
 */
TEST_F(DevNetworkTest, RunsUntilShutdown) {
  config_.block_time = 1ms;
  config_.message_interval = 2ms;
  initialize();

  auto io = std::make_shared<boost::asio::io_context>();
  auto context = std::make_shared<trestle::relay::RelayContext>(io);
  network_->start(context);
  boost::asio::steady_timer timer{*io, 50ms};
  timer.async_wait(
      [&](const boost::system::error_code &) { context->requestShutdown(); });
  io->run();

  auto produced = network_->source()->bestNumber();
  EXPECT_GT(produced, 0);
  EXPECT_EQ(network_->target()->bestNumber(), produced);
  EXPECT_OUTCOME_TRUE(
      outbound, network_->source()->messages()->outboundLaneData(lane_));
  ASSERT_TRUE(outbound.has_value());
  EXPECT_GT(outbound->latest_generated_nonce, 0);
}

/**
 * @given an opened lane of the source chain
 * @when messages are sent twice
 * @then both are queued on the lane in order
 */
TEST_F(DevNetworkTest, SendsMessagesOverLanes) {
  initialize();
  EXPECT_OUTCOME_TRUE_1(network_->sendMessages());
  EXPECT_OUTCOME_TRUE_1(network_->sendMessages());

  auto &messages = network_->source()->messages();
  EXPECT_OUTCOME_TRUE(outbound, messages->outboundLaneData(lane_));
  ASSERT_TRUE(outbound.has_value());
  EXPECT_EQ(outbound->latest_generated_nonce, 2);
  EXPECT_OUTCOME_TRUE(first, messages->outboundMessage(lane_, 1));
  EXPECT_EQ(first,
            std::optional{trestle::common::Buffer::fromString(
                "message #1 from Rialto")});
}
