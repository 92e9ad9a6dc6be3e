/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/parachains/para_head_admission_filter.hpp"

#include <gtest/gtest.h>

#include "bridge/parachains/paras_registry.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/grandpa/justification_builder.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using trestle::common::Buffer;
using trestle::common::Hash256;
using trestle::bridge::header_chain::HeaderChainConfig;
using trestle::bridge::header_chain::HeaderChainModule;
using trestle::bridge::parachains::ParachainsConfig;
using trestle::bridge::parachains::ParachainsError;
using trestle::bridge::parachains::ParachainsModule;
using trestle::bridge::parachains::ParaHead;
using trestle::bridge::parachains::ParaHeadAdmissionFilter;
using trestle::bridge::parachains::ParaHeadUpdate;
using trestle::bridge::parachains::ParaId;
using trestle::bridge::parachains::ParasRegistry;
using trestle::bridge::parachains::SubmitParachainHeadsCall;
using trestle::consensus::grandpa::JustificationVerifier;
using trestle::primitives::BlockHeader;
using trestle::primitives::BlockNumber;
using trestle::primitives::BlockInfo;
using trestle::storage::InMemoryStorage;
using trestle::storage::StateProof;

class ParaHeadAdmissionFilterTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static constexpr ParaId kParaId = 1000;
  static constexpr ParaId kOtherParaId = 1001;

  void SetUp() override {
    auto hasher = builder_.hasher();
    ParasRegistry registry{relay_state_, hasher};
    EXPECT_OUTCOME_TRUE_1(registry.setHead(kParaId, head_));
    EXPECT_OUTCOME_TRUE_1(registry.setHead(kOtherParaId, head_));

    // relay chain is known at #10 only, with the para head in its state
    relay_header_.number = 10;
    EXPECT_OUTCOME_TRUE(state_root,
                        trestle::storage::stateRoot(*relay_state_, *hasher));
    relay_header_.state_root = state_root;
    trestle::primitives::calculateBlockHash(relay_header_, *hasher);

    relay_chain_ = std::make_shared<HeaderChainModule>(
        std::make_shared<InMemoryStorage>(),
        hasher,
        std::make_shared<JustificationVerifier>(builder_.ed25519(), hasher),
        HeaderChainConfig{});
    EXPECT_OUTCOME_TRUE_1(relay_chain_->initialize(
        {.header = relay_header_,
         .authority_list = builder_.authoritySet().authorities,
         .set_id = 1}));

    EXPECT_OUTCOME_TRUE(key, ParasRegistry::headKey(*hasher, kParaId));
    EXPECT_OUTCOME_TRUE(
        proof,
        trestle::storage::prepareStateProof(*relay_state_, {key}, *hasher));
    proof_ = proof;

    parachains_ = std::make_shared<ParachainsModule>(
        std::make_shared<InMemoryStorage>(),
        hasher,
        relay_chain_,
        ParachainsConfig{});
    filter_ = std::make_unique<ParaHeadAdmissionFilter>(parachains_);
  }

  Hash256 headHash() const {
    return builder_.hasher()->blake2b_256(head_);
  }

  SubmitParachainHeadsCall call(BlockNumber relay_number,
                                const Hash256 &head_hash) const {
    return {
        .at_relay_block = {relay_number, relay_header_.hash()},
        .parachains = {{.para_id = kParaId, .head_hash = head_hash}},
        .heads_proof = {},
    };
  }

  void importHead() {
    EXPECT_OUTCOME_TRUE(
        info,
        parachains_->submitParachainHeads(
            relay_header_.blockInfo(),
            {{.para_id = kParaId, .head_hash = headHash()}},
            proof_));
    ASSERT_EQ(info.accepted, 1);
  }

  testutil::JustificationBuilder builder_{4};
  ParaHead head_ = Buffer::fromString("para head at #42");
  std::shared_ptr<InMemoryStorage> relay_state_ =
      std::make_shared<InMemoryStorage>();
  BlockHeader relay_header_;
  StateProof proof_;
  std::shared_ptr<HeaderChainModule> relay_chain_;
  std::shared_ptr<ParachainsModule> parachains_;
  std::unique_ptr<ParaHeadAdmissionFilter> filter_;
};

/**
 * @given no stored head of the para
 * @when filtering an update
 * @then it is admitted
 */
TEST_F(ParaHeadAdmissionFilterTest, AdmitsFirstHead) {
  EXPECT_OUTCOME_TRUE_1(filter_->validate(call(10, headHash())));
}

/**
 * @given a head of the para stored at relay block #10
 * @when filtering updates read at relay blocks #5, #10 and #15
 * @then only the update at #15 with a new head is admitted
 */
TEST_F(ParaHeadAdmissionFilterTest, RejectsStaleUpdates) {
  importHead();
  Hash256 new_head{};
  new_head[0] = 0x42;

  EXPECT_EC(filter_->validate(call(5, new_head)), ParachainsError::STALE);
  EXPECT_EC(filter_->validate(call(10, new_head)), ParachainsError::STALE);
  EXPECT_EC(filter_->validate(call(15, headHash())), ParachainsError::STALE);
  EXPECT_OUTCOME_TRUE_1(filter_->validate(call(15, new_head)));
}

/**
 * @given a stored head of the para
 * @when filtering an update of several parachains
 * @then the filter lets it through
 */
TEST_F(ParaHeadAdmissionFilterTest, IgnoresMultiParaUpdates) {
  importHead();
  auto update = call(5, headHash());
  update.parachains.push_back(
      ParaHeadUpdate{.para_id = kParaId + 1, .head_hash = {}});
  EXPECT_OUTCOME_TRUE_1(filter_->validate(update));
}

/**
 * @given a proof of the para head at a known relay block
 * @when submitting it with a wrong hash, then with the right one
 * @then the wrong one is skipped and the right one becomes the best head
 */
TEST_F(ParaHeadAdmissionFilterTest, ImportsProvenHead) {
  EXPECT_OUTCOME_TRUE(skipped,
                      parachains_->submitParachainHeads(
                          relay_header_.blockInfo(),
                          {{.para_id = kParaId, .head_hash = {}}},
                          proof_));
  EXPECT_EQ(skipped.accepted, 0);
  EXPECT_EQ(skipped.skipped, 1);

  importHead();
  EXPECT_OUTCOME_TRUE(best, parachains_->bestParaHead(kParaId));
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->best_head_hash.at_relay_block_number, 10);
  EXPECT_EQ(best->best_head_hash.head_hash, headHash());
  EXPECT_OUTCOME_TRUE(data, parachains_->bestParaHeadData(kParaId));
  EXPECT_EQ(data, std::optional<ParaHead>{head_});
}

/**
 * @given heads submitted at an unknown relay block or with a wrong number
 * @when submitting them
 * @then the relay block is rejected
 */
TEST_F(ParaHeadAdmissionFilterTest, RejectsUnknownRelayBlock) {
  std::vector<ParaHeadUpdate> updates{
      {.para_id = kParaId, .head_hash = headHash()}};
  EXPECT_EC(parachains_->submitParachainHeads(
                BlockInfo{10, trestle::primitives::BlockHash{}},
                updates,
                proof_),
            ParachainsError::UNKNOWN_RELAY_CHAIN_BLOCK);
  EXPECT_EC(parachains_->submitParachainHeads(
                BlockInfo{11, relay_header_.hash()}, updates, proof_),
            ParachainsError::INVALID_RELAY_CHAIN_BLOCK_NUMBER);
}

/**
 * @given a proof of the heads of two parachains
 * @when submitting the head of one of them only
 * @then the call fails on the unused proof entry and no head is stored
 */
TEST_F(ParaHeadAdmissionFilterTest, StoresNothingOnUnusedProofEntries) {
  auto hasher = builder_.hasher();
  EXPECT_OUTCOME_TRUE(key, ParasRegistry::headKey(*hasher, kParaId));
  EXPECT_OUTCOME_TRUE(other_key,
                      ParasRegistry::headKey(*hasher, kOtherParaId));
  EXPECT_OUTCOME_TRUE(proof,
                      trestle::storage::prepareStateProof(
                          *relay_state_, {key, other_key}, *hasher));

  EXPECT_EC(parachains_->submitParachainHeads(
                relay_header_.blockInfo(),
                {{.para_id = kParaId, .head_hash = headHash()}},
                proof),
            trestle::storage::StateProofError::UNUSED_ENTRIES_IN_THE_PROOF);
  EXPECT_OUTCOME_TRUE(best, parachains_->bestParaHead(kParaId));
  EXPECT_EQ(best, std::nullopt);
  EXPECT_OUTCOME_TRUE(data,
                      parachains_->importedParaHead(kParaId, headHash()));
  EXPECT_EQ(data, std::nullopt);
}
