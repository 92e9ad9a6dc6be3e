/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "devnet/dev_clients.hpp"
#include "devnet/dev_network.hpp"
#include "relay/client_error.hpp"
#include "relay/finality_loop.hpp"
#include "relay/message_lane_loop.hpp"
#include "relay/parachains_loop.hpp"
#include "testutil/coro.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace trestle::devnet;
using trestle::bridge::AccountId;
using trestle::bridge::ChainId;
using trestle::bridge::messages::LaneId;
using trestle::bridge::relayers::RewardsAccountOwner;
using trestle::bridge::relayers::RewardsAccountParams;
using trestle::relay::ClientError;
using trestle::relay::FinalityLoop;
using trestle::relay::MessageConfirmationRace;
using trestle::relay::MessageDeliveryRace;
using trestle::relay::MessageLaneParams;
using trestle::relay::ParachainsLoop;
using trestle::relay::ParachainsParams;
using trestle::relay::RelayTask;
using trestle::relay::RelayTimings;

class RelayLoopsTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static constexpr trestle::bridge::parachains::ParaId kParaId = 1000;

  void SetUp() override {
    lane_[3] = 1;
    relayer_[0] = 7;

    DevNetworkConfig config;
    config.justification_period = 4;
    config.lanes = {lane_};
    config.parachains = {kParaId};
    configure(config);
    network_ = std::make_shared<DevNetwork>(config, hasher_, ed25519_);
    EXPECT_OUTCOME_TRUE_1(network_->initialize());

    auto &source = network_->source();
    auto &target = network_->target();
    auto verifier =
        std::make_shared<trestle::consensus::grandpa::JustificationVerifier>(
            ed25519_, hasher_);
    forward_finality_ = std::make_shared<FinalityLoop>(
        "Rialto->Millau",
        std::make_shared<DevFinalitySourceClient>(source),
        std::make_shared<DevFinalityTargetClient>(target),
        verifier,
        hasher_,
        RelayTimings{});
    backward_finality_ = std::make_shared<FinalityLoop>(
        "Millau->Rialto",
        std::make_shared<DevFinalitySourceClient>(target),
        std::make_shared<DevFinalityTargetClient>(source),
        verifier,
        hasher_,
        RelayTimings{});

    MessageLaneParams params{.lane = lane_, .relayer = relayer_};
    auto messages_source = std::make_shared<DevMessagesSourceClient>(source);
    auto messages_target = std::make_shared<DevMessagesTargetClient>(target);
    delivery_ = std::make_shared<MessageDeliveryRace>(
        "delivery", messages_source, messages_target, params);
    confirmation_ = std::make_shared<MessageConfirmationRace>(
        "confirmation", messages_source, messages_target, params);

    parachains_ = std::make_shared<ParachainsLoop>(
        "parachains",
        std::make_shared<DevParachainsSourceClient>(source),
        std::make_shared<DevParachainsTargetClient>(target),
        hasher_,
        ParachainsParams{.para_ids = {kParaId}});
  }

  virtual void configure(DevNetworkConfig &) {}

  void produceBlocks(size_t count) {
    for (size_t i = 0; i < count; ++i) {
      EXPECT_OUTCOME_TRUE_1(network_->produceBlocks());
    }
  }

  static void tick(RelayTask &task) {
    EXPECT_OUTCOME_TRUE_1(testutil::runCoro(task.tick()));
  }

  trestle::primitives::BlockNumber bestSourceAtTarget() const {
    auto best = network_->target()->headerChain()->bestFinalized();
    EXPECT_TRUE(best.has_value() and best.value().has_value());
    return best.value()->number;
  }

  std::shared_ptr<trestle::crypto::HasherImpl> hasher_ =
      std::make_shared<trestle::crypto::HasherImpl>();
  std::shared_ptr<trestle::crypto::Ed25519ProviderImpl> ed25519_ =
      std::make_shared<trestle::crypto::Ed25519ProviderImpl>();

  LaneId lane_;
  AccountId relayer_;
  std::shared_ptr<DevNetwork> network_;

  std::shared_ptr<FinalityLoop> forward_finality_;
  std::shared_ptr<FinalityLoop> backward_finality_;
  std::shared_ptr<MessageDeliveryRace> delivery_;
  std::shared_ptr<MessageConfirmationRace> confirmation_;
  std::shared_ptr<ParachainsLoop> parachains_;
};

/**
 * @given 5 source blocks, the 4th one justified
 * @when the finality loop ticks
 * @then the target imports the justified header and nothing else is
 * submitted after it
 */
TEST_F(RelayLoopsTest, RelaysJustifiedHeaders) {
  produceBlocks(5);
  tick(*forward_finality_);
  EXPECT_EQ(bestSourceAtTarget(), 4);
  EXPECT_OUTCOME_TRUE(best, network_->target()->headerChain()->bestFinalized());
  EXPECT_EQ(best, network_->source()->bestFinalized());

  tick(*forward_finality_);
  EXPECT_EQ(bestSourceAtTarget(), 4);
}

/**
 * @given 5 source blocks, the 4th one justified, and a loop reading two
 * headers per tick
 * @when the finality loop ticks twice
 * @then the first tick submits nothing and the second one resumes after the
 * scanned headers and submits the justified header
 */
TEST_F(RelayLoopsTest, LimitsHeadersReadPerTick) {
  produceBlocks(5);
  FinalityLoop finality(
      "Rialto->Millau",
      std::make_shared<DevFinalitySourceClient>(network_->source()),
      std::make_shared<DevFinalityTargetClient>(network_->target()),
      std::make_shared<trestle::consensus::grandpa::JustificationVerifier>(
          ed25519_, hasher_),
      hasher_,
      RelayTimings{.max_headers_per_tick = 2});

  tick(finality);
  EXPECT_EQ(bestSourceAtTarget(), 0);

  tick(finality);
  EXPECT_EQ(bestSourceAtTarget(), 4);
}

class MandatoryHeadersTest : public RelayLoopsTest {
 protected:
  void configure(DevNetworkConfig &config) override {
    config.authority_set_change_period = 3;
  }
};

/**
 * @given source block #3 changing the authority set and justified #4
 * @when the finality loop ticks
 * @then #3 is imported first and #4 is verified with the new set
 */
TEST_F(MandatoryHeadersTest, SubmitsSetChangeFirst) {
  produceBlocks(5);

  tick(*forward_finality_);
  EXPECT_EQ(bestSourceAtTarget(), 3);
  EXPECT_OUTCOME_TRUE(set,
                      network_->target()->headerChain()->currentAuthoritySet());
  EXPECT_EQ(set.id, 1);

  tick(*forward_finality_);
  EXPECT_EQ(bestSourceAtTarget(), 4);
}

/**
 * @given 2 messages sent before the source block finalized at the target
 * @when the delivery race, the backward finality loop and the confirmation
 * race tick
 * @then messages are dispatched at the target, confirmed at the source and
 * the relayer is rewarded for both deliveries and the confirmation
 */
TEST_F(RelayLoopsTest, DeliversAndConfirmsMessages) {
  EXPECT_OUTCOME_TRUE_1(network_->sendMessages());
  EXPECT_OUTCOME_TRUE_1(network_->sendMessages());
  produceBlocks(4);
  tick(*forward_finality_);

  tick(*delivery_);
  EXPECT_OUTCOME_TRUE(inbound,
                      network_->target()->messages()->inboundLaneData(lane_));
  ASSERT_TRUE(inbound.has_value());
  EXPECT_EQ(inbound->lastDeliveredNonce(), 2);
  EXPECT_EQ(network_->target()->dispatch()->dispatched(), 2);

  // nothing new, the lanes are in sync
  tick(*delivery_);
  EXPECT_EQ(network_->target()->dispatch()->dispatched(), 2);

  // the confirmation waits for the target block with the delivery
  produceBlocks(4);
  tick(*backward_finality_);
  tick(*confirmation_);
  EXPECT_OUTCOME_TRUE(outbound,
                      network_->source()->messages()->outboundLaneData(lane_));
  ASSERT_TRUE(outbound.has_value());
  EXPECT_EQ(outbound->latest_received_nonce, 2);

  RewardsAccountParams params{
      .lane = lane_,
      .bridged_chain = network_->source()->config().bridged_chain_id,
      .owner = RewardsAccountOwner::BRIDGED_CHAIN,
  };
  EXPECT_OUTCOME_TRUE(
      reward,
      network_->source()->relayersLedger()->relayerReward(relayer_, params));
  auto &rewards = network_->config().rewards;
  EXPECT_EQ(reward,
            std::optional<trestle::bridge::Balance>{
                2 * rewards.delivery_reward_per_message
                + rewards.confirmation_reward});
}

/**
 * @given a parachain head advancing with every source block
 * @when the parachains loop ticks after the finality loop
 * @then the head read at the best source block known to the target is
 * imported, and it is not submitted again
 */
TEST_F(RelayLoopsTest, RelaysParachainHeads) {
  auto best_head_at = [&]() -> trestle::primitives::BlockNumber {
    auto info = network_->target()->parachains()->bestParaHead(kParaId);
    EXPECT_TRUE(info.has_value() and info.value().has_value());
    return info.value()->best_head_hash.at_relay_block_number;
  };

  produceBlocks(4);
  tick(*forward_finality_);
  tick(*parachains_);
  EXPECT_EQ(best_head_at(), 4);
  tick(*parachains_);
  EXPECT_EQ(best_head_at(), 4);

  produceBlocks(4);
  tick(*forward_finality_);
  tick(*parachains_);
  EXPECT_EQ(best_head_at(), 8);
}

/**
 * @given an unreachable target node
 * @when the finality loop ticks
 * @then a connection error is returned until the node is back
 */
TEST_F(RelayLoopsTest, ReportsConnectionLoss) {
  produceBlocks(4);
  network_->target()->setConnected(false);
  EXPECT_EC(testutil::runCoro(forward_finality_->tick()),
            ClientError::CONNECTION_LOST);
  EXPECT_EC(testutil::runCoro(forward_finality_->reconnect()),
            ClientError::CONNECTION_LOST);

  network_->target()->setConnected(true);
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(forward_finality_->reconnect()));
  tick(*forward_finality_);
  EXPECT_EQ(bestSourceAtTarget(), 4);
}
