/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/equivocations_collector.hpp"

#include <set>

#include <gtest/gtest.h>

#include "testutil/grandpa/justification_builder.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using trestle::consensus::grandpa::EquivocationProof;
using trestle::consensus::grandpa::EquivocationsCollector;
using trestle::consensus::grandpa::JustificationError;
using trestle::primitives::BlockHash;
using trestle::primitives::BlockHeader;
using testutil::GrandpaJustification;

class EquivocationsCollectorTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  testutil::JustificationBuilder builder_{4, 7, 5};
  std::vector<BlockHeader> chain_ = builder_.chain({0, BlockHash{}}, 2);
  // a fork of #1, the same number as the main chain #2
  std::vector<BlockHeader> fork_ =
      builder_.chain(chain_[0].blockInfo(), 1, 1);
};

/**
 * @given a justification of the round and another one of the same round
 * where two authorities vote for a competing block
 * @when collecting equivocations from both
 * @then both authorities are reported with their two votes
 */
TEST_F(EquivocationsCollectorTest, CollectsAcrossJustifications) {
  auto base = builder_.justify(chain_[1].blockInfo(), 4);
  EXPECT_OUTCOME_TRUE(collector,
                      EquivocationsCollector::create(builder_.ed25519(),
                                                     builder_.hasher(),
                                                     builder_.voterSet(),
                                                     base));

  auto other = builder_.justify(fork_[0].blockInfo(), 0);
  other.commit.precommits.emplace_back(builder_.sign(1, fork_[0].blockInfo()));
  other.commit.precommits.emplace_back(builder_.sign(3, fork_[0].blockInfo()));
  EXPECT_OUTCOME_TRUE_1(collector->parseJustification(other));

  auto proofs = collector->intoEquivocationProofs();
  ASSERT_EQ(proofs.size(), 2);
  std::set<trestle::consensus::grandpa::Id> offenders;
  for (auto &proof : proofs) {
    EXPECT_EQ(proof.set_id, 7);
    EXPECT_EQ(proof.equivocation.round, 5);
    EXPECT_EQ(proof.equivocation.first.precommit.hash, chain_[1].hash());
    EXPECT_EQ(proof.equivocation.second.precommit.hash, fork_[0].hash());
    offenders.insert(proof.equivocation.id);
  }
  EXPECT_TRUE(offenders.contains(builder_.key(1).public_key));
  EXPECT_TRUE(offenders.contains(builder_.key(3).public_key));

  // drained
  EXPECT_TRUE(collector->intoEquivocationProofs().empty());
}

/**
 * @given a collector of round 5
 * @when a justification of another round is parsed
 * @then it fails and no equivocations appear
 */
TEST_F(EquivocationsCollectorTest, RejectsOtherRound) {
  auto base = builder_.justify(chain_[1].blockInfo(), 4);
  EXPECT_OUTCOME_TRUE(collector,
                      EquivocationsCollector::create(builder_.ed25519(),
                                                     builder_.hasher(),
                                                     builder_.voterSet(),
                                                     base));

  testutil::JustificationBuilder next_round{4, 7, 6};
  auto other = next_round.justify(fork_[0].blockInfo(), 4);
  EXPECT_EC(collector->parseJustification(other),
            JustificationError::INVALID_ROUND);
  EXPECT_TRUE(collector->intoEquivocationProofs().empty());
}

/**
 * @given a justification with an equivocation inside, an unknown voter and
 * an unrelated vote
 * @when creating a collector of it
 * @then the collector does not fail and reports the equivocation only
 */
TEST_F(EquivocationsCollectorTest, ToleratesMalformedVotes) {
  auto base = builder_.justify(chain_[0].blockInfo(), 3);
  base.commit.precommits.emplace_back(builder_.sign(0, fork_[0].blockInfo()));
  base.commit.precommits.emplace_back(
      builder_.sign(builder_.keypair("//Stranger"), chain_[0].blockInfo()));

  EXPECT_OUTCOME_TRUE(collector,
                      EquivocationsCollector::create(builder_.ed25519(),
                                                     builder_.hasher(),
                                                     builder_.voterSet(),
                                                     base));
  auto proofs = collector->intoEquivocationProofs();
  ASSERT_EQ(proofs.size(), 1);
  EXPECT_EQ(proofs[0].equivocation.id, builder_.key(0).public_key);
}

/**
 * @given an equivocation proof
 * @when encoding it
 * @then it starts with the set id and the precommit variant index
 */
TEST_F(EquivocationsCollectorTest, ProofEncoding) {
  EquivocationProof proof{
      .set_id = 7,
      .equivocation = {.round = 5,
                       .id = builder_.key(0).public_key,
                       .first = builder_.sign(0, chain_[0].blockInfo()),
                       .second = builder_.sign(0, fork_[0].blockInfo())},
  };
  EXPECT_OUTCOME_TRUE(encoded, trestle::scale::encode(proof));
  ASSERT_GT(encoded.size(), 9);
  EXPECT_EQ(encoded[0], 7);
  EXPECT_EQ(encoded[8], 1);

  EXPECT_OUTCOME_TRUE(decoded,
                      trestle::scale::decode<EquivocationProof>(encoded));
  EXPECT_EQ(decoded, proof);
}

/**
 * @given a justification where one precommit is included twice
 * @when the same justification is collected again
 * @then repeated identical votes are not reported as equivocations
 */
TEST_F(EquivocationsCollectorTest, IgnoresIdenticalVotes) {
  auto base = builder_.justify(chain_[1].blockInfo(), 4);
  base.commit.precommits.emplace_back(base.commit.precommits.front());
  EXPECT_OUTCOME_TRUE(collector,
                      EquivocationsCollector::create(builder_.ed25519(),
                                                     builder_.hasher(),
                                                     builder_.voterSet(),
                                                     base));
  EXPECT_OUTCOME_TRUE_1(collector->parseJustification(base));

  EXPECT_TRUE(collector->intoEquivocationProofs().empty());
}
