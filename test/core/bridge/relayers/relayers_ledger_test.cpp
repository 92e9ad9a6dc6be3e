/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/relayers/relayers_ledger.hpp"

#include <limits>

#include <gtest/gtest.h>

#include "bridge/relayers/delivery_confirmation_payments_adapter.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "mock/core/bridge/relayers/payment_procedure_mock.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using trestle::bridge::AccountId;
using trestle::bridge::Balance;
using trestle::bridge::ChainId;
using trestle::bridge::messages::DeliveredMessages;
using trestle::bridge::messages::LaneId;
using trestle::bridge::messages::UnrewardedRelayer;
using trestle::bridge::relayers::DeliveryConfirmationPaymentsAdapter;
using trestle::bridge::relayers::PaymentProcedureMock;
using trestle::bridge::relayers::RelayersError;
using trestle::bridge::relayers::RelayersLedger;
using trestle::bridge::relayers::RewardsAccountOwner;
using trestle::bridge::relayers::RewardsAccountParams;
using trestle::bridge::relayers::RewardsConfig;
using testing::_;
using testing::Return;

class RelayersLedgerTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static AccountId account(uint8_t i) {
    AccountId id;
    id[0] = i;
    return id;
  }

  std::shared_ptr<PaymentProcedureMock> payment_ =
      std::make_shared<PaymentProcedureMock>();
  std::shared_ptr<RelayersLedger> ledger_ = std::make_shared<RelayersLedger>(
      std::make_shared<trestle::storage::InMemoryStorage>(),
      std::make_shared<trestle::crypto::HasherImpl>(),
      payment_);
  RewardsAccountParams params_{
      .lane = LaneId{},
      .bridged_chain = ChainId{},
      .owner = RewardsAccountOwner::BRIDGED_CHAIN,
  };
};

/**
 * @given a relayer earning rewards twice
 * @when claiming them
 * @then the sum is paid once and the ledger entry is removed
 */
TEST_F(RelayersLedgerTest, AccumulatesAndClaims) {
  EXPECT_OUTCOME_TRUE_1(
      ledger_->registerRelayerReward(account(1), params_, 10));
  EXPECT_OUTCOME_TRUE_1(
      ledger_->registerRelayerReward(account(1), params_, 5));
  EXPECT_OUTCOME_TRUE(reward, ledger_->relayerReward(account(1), params_));
  EXPECT_EQ(reward, std::optional<Balance>{15});

  EXPECT_CALL(*payment_, payReward(account(1), params_, 15))
      .WillOnce(Return(outcome::success()));
  EXPECT_OUTCOME_TRUE(paid, ledger_->claimRewards(account(1), params_));
  EXPECT_EQ(paid, 15);
  EXPECT_EC(ledger_->claimRewards(account(1), params_),
            RelayersError::NO_REWARD_FOR_RELAYER);
}

/**
 * @given rewards of one relayer from the two sides of a lane
 * @when querying them
 * @then they are kept apart
 */
TEST_F(RelayersLedgerTest, SeparatesRewardAccounts) {
  auto other = params_;
  other.owner = RewardsAccountOwner::THIS_CHAIN;
  EXPECT_OUTCOME_TRUE_1(
      ledger_->registerRelayerReward(account(1), params_, 10));
  EXPECT_OUTCOME_TRUE(missing, ledger_->relayerReward(account(1), other));
  EXPECT_FALSE(missing.has_value());
}

/**
 * @given a reward close to the balance limit
 * @when more is registered
 * @then the reward saturates
 */
TEST_F(RelayersLedgerTest, SaturatesReward) {
  auto max = std::numeric_limits<Balance>::max();
  EXPECT_OUTCOME_TRUE_1(
      ledger_->registerRelayerReward(account(1), params_, max - 1));
  EXPECT_OUTCOME_TRUE_1(
      ledger_->registerRelayerReward(account(1), params_, 5));
  EXPECT_OUTCOME_TRUE(reward, ledger_->relayerReward(account(1), params_));
  EXPECT_EQ(reward, std::optional<Balance>{max});
}

/**
 * @given a payment procedure failing to pay
 * @when the relayer claims the reward
 * @then the reward stays in the ledger
 */
TEST_F(RelayersLedgerTest, KeepsRewardOnPaymentFailure) {
  EXPECT_OUTCOME_TRUE_1(
      ledger_->registerRelayerReward(account(1), params_, 10));
  EXPECT_CALL(*payment_, payReward(_, _, _))
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_EC(ledger_->claimRewards(account(1), params_),
            RelayersError::FAILED_TO_PAY_REWARD);
  EXPECT_OUTCOME_TRUE(reward, ledger_->relayerReward(account(1), params_));
  EXPECT_EQ(reward, std::optional<Balance>{10});
}

/**
 * @given 3 messages delivered by 2 relayers, 2 of them confirmed now
 * @when paying rewards for the confirmed range
 * @then each delivering relayer gets paid for its confirmed messages and
 * the confirming relayer gets its reward
 */
TEST_F(RelayersLedgerTest, PaysDeliveryAndConfirmation) {
  DeliveryConfirmationPaymentsAdapter adapter{
      ledger_,
      ChainId{},
      RewardsConfig{.delivery_reward_per_message = 100,
                    .confirmation_reward = 7}};
  trestle::bridge::messages::UnrewardedRelayers relayers{
      UnrewardedRelayer{.relayer = account(1),
                        .messages = {.begin = 1, .end = 2}},
      UnrewardedRelayer{.relayer = account(2),
                        .messages = {.begin = 3, .end = 3}},
  };

  auto rewarded = adapter.payReward(
      LaneId{}, relayers, account(9), DeliveredMessages{.begin = 2, .end = 3});
  EXPECT_EQ(rewarded, 2);

  EXPECT_OUTCOME_TRUE(first, ledger_->relayerReward(account(1), params_));
  EXPECT_EQ(first, std::optional<Balance>{100});
  EXPECT_OUTCOME_TRUE(second, ledger_->relayerReward(account(2), params_));
  EXPECT_EQ(second, std::optional<Balance>{100});
  EXPECT_OUTCOME_TRUE(confirmer, ledger_->relayerReward(account(9), params_));
  EXPECT_EQ(confirmer, std::optional<Balance>{7});
}
