/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/justification_verifier.hpp"

#include <gtest/gtest.h>

#include "testutil/grandpa/justification_builder.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using trestle::common::Buffer;
using trestle::consensus::grandpa::decodeJustification;
using trestle::consensus::grandpa::JustificationError;
using trestle::consensus::grandpa::JustificationVerifier;
using trestle::consensus::grandpa::maxReasonableSize;
using trestle::consensus::grandpa::VerificationPolicy;
using trestle::primitives::BlockHash;
using trestle::primitives::BlockHeader;
using trestle::primitives::BlockInfo;
using testutil::GrandpaJustification;

class JustificationVerifierTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  void SetUp() override {
    // #1 <- #2 <- #3 <- #4
    chain_ = builder_.chain({0, BlockHash{}}, 4);
    target_ = chain_[0].blockInfo();
  }

  /// Every listed authority votes for the given block
  GrandpaJustification justifyWithVotesFor(const BlockInfo &vote_target,
                                           std::vector<size_t> authorities) {
    GrandpaJustification justification{
        .round = 1,
        .commit = {.target_hash = target_.hash,
                   .target_number = target_.number},
    };
    for (auto i : authorities) {
      justification.commit.precommits.emplace_back(
          builder_.sign(i, vote_target));
    }
    return justification;
  }

  testutil::JustificationBuilder builder_{4};
  std::shared_ptr<testutil::VoterSet> voters_ = builder_.voterSet();
  JustificationVerifier verifier_{builder_.ed25519(), builder_.hasher()};
  std::vector<BlockHeader> chain_;
  BlockInfo target_;
};

/**
 * @given 3 of 4 authorities voting for the commit target
 * @when verifying the justification
 * @then it is accepted
 */
TEST_F(JustificationVerifierTest, AcceptsSupermajority) {
  auto justification = builder_.justify(target_, 3);
  EXPECT_OUTCOME_TRUE_1(verifier_.verify(target_, justification, *voters_));
}

/**
 * @given 2 of 4 authorities voting for the commit target
 * @when verifying the justification
 * @then it is rejected for the low weight
 */
TEST_F(JustificationVerifierTest, RejectsTooLowWeight) {
  auto justification = builder_.justify(target_, 2);
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::TOO_LOW_CUMULATIVE_WEIGHT);
}

/**
 * @given a valid justification of #1
 * @when verifying it as a justification of #2
 * @then it is rejected for the target mismatch
 */
TEST_F(JustificationVerifierTest, RejectsOtherTarget) {
  auto justification = builder_.justify(target_, 4);
  EXPECT_EC(verifier_.verify(chain_[1].blockInfo(), justification, *voters_),
            JustificationError::INVALID_JUSTIFICATION_TARGET);
}

/**
 * @given votes for #3 and the ancestries #3, #2 connecting it to target #1
 * @when verifying the justification
 * @then the votes are related and the justification is accepted
 */
TEST_F(JustificationVerifierTest, AcceptsVotesForDescendants) {
  auto justification = justifyWithVotesFor(chain_[2].blockInfo(), {0, 1, 2});
  justification.votes_ancestries = {chain_[2], chain_[1]};
  EXPECT_OUTCOME_TRUE_1(verifier_.verify(target_, justification, *voters_));
}

/**
 * @given votes for #3 and a gap in the ancestries
 * @when verifying the justification strictly
 * @then the vote is unrelated to the target
 */
TEST_F(JustificationVerifierTest, RejectsUnrelatedVote) {
  auto justification = justifyWithVotesFor(chain_[2].blockInfo(), {0, 1, 2});
  justification.votes_ancestries = {chain_[2]};
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::UNRELATED_ANCESTRY_VOTE);
}

/**
 * @given a valid justification carrying the unused ancestry #4
 * @when verifying it strictly
 * @then the ancestry is reported as redundant
 */
TEST_F(JustificationVerifierTest, RejectsRedundantAncestries) {
  auto justification = justifyWithVotesFor(chain_[1].blockInfo(), {0, 1, 2});
  justification.votes_ancestries = {chain_[1], chain_[3]};
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::REDUNDANT_VOTES_ANCESTRIES);
}

/**
 * @given an authority voting for two different blocks
 * @when verifying the justification strictly
 * @then the equivocation is an error
 */
TEST_F(JustificationVerifierTest, RejectsEquivocation) {
  auto justification = justifyWithVotesFor(target_, {0, 1, 2});
  justification.commit.precommits.emplace_back(
      builder_.sign(0, chain_[1].blockInfo()));
  justification.votes_ancestries = {chain_[1]};
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::EQUIVOCATING_AUTHORITY_VOTE);
}

/**
 * @given a justification where one authority votes twice for the target
 * @when verifying it
 * @then the repeated vote is counted once, which is not enough
 */
TEST_F(JustificationVerifierTest, DuplicateVoteCountedOnce) {
  auto justification = justifyWithVotesFor(target_, {0, 1, 1});
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::TOO_LOW_CUMULATIVE_WEIGHT);
}

/**
 * @given 3 valid votes and a vote with a broken signature
 * @when verifying the justification
 * @then the broken vote is skipped and the justification is accepted
 */
TEST_F(JustificationVerifierTest, InvalidSignatureSkipped) {
  auto justification = justifyWithVotesFor(target_, {0, 1, 2, 3});
  justification.commit.precommits[3].signature[0] ^= 0xff;
  EXPECT_OUTCOME_TRUE_1(verifier_.verify(target_, justification, *voters_));

  justification.commit.precommits[2].signature[0] ^= 0xff;
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::TOO_LOW_CUMULATIVE_WEIGHT);
}

/**
 * @given votes signed for another authority set id
 * @when verifying them against the current set
 * @then none of the signatures matches
 */
TEST_F(JustificationVerifierTest, SignaturesAreBoundToSetId) {
  testutil::JustificationBuilder other_set{4, 2};
  auto justification = other_set.justify(target_, 4);
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::TOO_LOW_CUMULATIVE_WEIGHT);
}

/**
 * @given 2 authority votes and a vote of an unknown key
 * @when verifying the justification
 * @then the unknown vote adds no weight
 */
TEST_F(JustificationVerifierTest, UnknownAuthoritySkipped) {
  auto justification = justifyWithVotesFor(target_, {0, 1});
  justification.commit.precommits.emplace_back(
      builder_.sign(builder_.keypair("//Stranger"), target_));
  EXPECT_EC(verifier_.verify(target_, justification, *voters_),
            JustificationError::TOO_LOW_CUMULATIVE_WEIGHT);
}

/**
 * @given every authority votes, one vote is an equivocation and an
 * ancestry is unused
 * @when optimizing the justification
 * @then only the votes reaching the threshold and their ancestries stay,
 * and the result passes the strict verification
 */
TEST_F(JustificationVerifierTest, OptimizeDropsRedundantData) {
  auto justification = justifyWithVotesFor(chain_[1].blockInfo(), {0});
  justification.commit.precommits.emplace_back(builder_.sign(0, target_));
  for (size_t i = 1; i < 4; ++i) {
    justification.commit.precommits.emplace_back(
        builder_.sign(i, chain_[1].blockInfo()));
  }
  justification.votes_ancestries = {chain_[3], chain_[1]};

  EXPECT_OUTCOME_TRUE_1(verifier_.verify(
      target_, justification, *voters_, VerificationPolicy::OPTIMIZE));

  ASSERT_EQ(justification.commit.precommits.size(), 3);
  EXPECT_EQ(justification.commit.precommits[0].id, builder_.key(0).public_key);
  EXPECT_EQ(justification.commit.precommits[1].id, builder_.key(1).public_key);
  EXPECT_EQ(justification.commit.precommits[2].id, builder_.key(2).public_key);
  EXPECT_EQ(justification.votes_ancestries,
            std::vector<BlockHeader>{chain_[1]});

  EXPECT_OUTCOME_TRUE_1(verifier_.verify(target_, justification, *voters_));
}

/**
 * @given a justification without enough votes
 * @when optimizing it
 * @then it fails and the justification is left untouched
 */
TEST_F(JustificationVerifierTest, OptimizeKeepsInvalidJustification) {
  auto justification = justifyWithVotesFor(target_, {0, 1});
  justification.votes_ancestries = {chain_[3]};
  auto original = justification;
  EXPECT_EC(verifier_.optimize(target_, justification, *voters_),
            JustificationError::TOO_LOW_CUMULATIVE_WEIGHT);
  EXPECT_EQ(justification, original);
}

/**
 * @given bytes which are not a justification
 * @when decoding them
 * @then the decode error is returned
 */
TEST_F(JustificationVerifierTest, DecodeError) {
  EXPECT_EC(decodeJustification(Buffer{1, 2, 3}),
            JustificationError::JUSTIFICATION_DECODE);
}

/**
 * @given huge number of required precommits
 * @when estimating the reasonable size of a justification
 * @then the estimation grows with precommits and saturates
 */
TEST(JustificationSizeTest, MaxReasonableSize) {
  EXPECT_LT(maxReasonableSize(3), maxReasonableSize(4));
  EXPECT_EQ(maxReasonableSize(std::numeric_limits<uint32_t>::max()),
            std::numeric_limits<uint32_t>::max());
}
