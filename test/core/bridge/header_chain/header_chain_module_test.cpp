/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/header_chain/header_chain_module.hpp"

#include <gtest/gtest.h>

#include "bridge/header_chain/submit_finality_proof_filter.hpp"
#include "primitives/scheduled_change.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/grandpa/justification_builder.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using trestle::bridge::header_chain::BasicOperatingMode;
using trestle::bridge::header_chain::HeaderChainConfig;
using trestle::bridge::header_chain::HeaderChainError;
using trestle::bridge::header_chain::HeaderChainModule;
using trestle::bridge::header_chain::InitializationData;
using trestle::bridge::header_chain::SubmitFinalityProofCall;
using trestle::bridge::header_chain::SubmitFinalityProofFilter;
using trestle::consensus::grandpa::JustificationVerifier;
using trestle::primitives::BlockHeader;
using trestle::primitives::BlockInfo;
using trestle::primitives::GrandpaConsensusLog;
using trestle::primitives::ScheduledChange;
using trestle::storage::InMemoryStorage;

class HeaderChainModuleTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  void SetUp() override {
    genesis_.state_root[0] = 1;
    trestle::primitives::calculateBlockHash(genesis_, *builder_.hasher());
    chain_ = builder_.chain(genesis_.blockInfo(), 5);
    module_ = makeModule(HeaderChainConfig{});
  }

  std::shared_ptr<HeaderChainModule> makeModule(HeaderChainConfig config) {
    return std::make_shared<HeaderChainModule>(
        std::make_shared<InMemoryStorage>(),
        builder_.hasher(),
        std::make_shared<JustificationVerifier>(builder_.ed25519(),
                                                builder_.hasher()),
        config);
  }

  InitializationData initData() const {
    return {
        .header = genesis_,
        .authority_list = builder_.authoritySet().authorities,
        .set_id = 1,
    };
  }

  testutil::JustificationBuilder builder_{4};
  BlockHeader genesis_;
  std::vector<BlockHeader> chain_;
  std::shared_ptr<HeaderChainModule> module_;
};

/**
 * @given a fresh module
 * @when it is initialized twice
 * @then the first call sets the best finalized header, the second fails
 */
TEST_F(HeaderChainModuleTest, Initialize) {
  EXPECT_EC(module_->currentAuthoritySet(), HeaderChainError::NOT_INITIALIZED);
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  EXPECT_OUTCOME_TRUE(best, module_->bestFinalized());
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(*best, genesis_.blockInfo());
  EXPECT_OUTCOME_TRUE(set, module_->currentAuthoritySet());
  EXPECT_EQ(set.id, 1);
  EXPECT_EC(module_->initialize(initData()),
            HeaderChainError::ALREADY_INITIALIZED);
}

/**
 * @given an initialized module
 * @when a justified header is submitted
 * @then it becomes the best finalized one and its state root is stored
 */
TEST_F(HeaderChainModuleTest, ImportsJustifiedHeader) {
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  auto target = chain_[2].blockInfo();

  EXPECT_OUTCOME_TRUE(
      info,
      module_->submitFinalityProof(chain_[2], builder_.justify(target, 3), 1));
  EXPECT_EQ(info.block_number, 3);
  EXPECT_FALSE(info.is_mandatory);
  EXPECT_EQ(info.extra_size, 0);

  EXPECT_OUTCOME_TRUE(best, module_->bestFinalized());
  EXPECT_EQ(*best, target);
  EXPECT_OUTCOME_TRUE(stored, module_->importedHeader(target.hash));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->number, 3);
  EXPECT_EQ(stored->state_root, chain_[2].state_root);
}

/**
 * @given a module finalized up to #3
 * @when submitting an older header, a wrong set id or too few votes
 * @then every call is rejected and the best header is kept
 */
TEST_F(HeaderChainModuleTest, RejectsInvalidSubmissions) {
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  EXPECT_OUTCOME_TRUE_1(module_->submitFinalityProof(
      chain_[2], builder_.justify(chain_[2].blockInfo(), 3), 1));

  EXPECT_EC(module_->submitFinalityProof(
                chain_[1], builder_.justify(chain_[1].blockInfo(), 3), 1),
            HeaderChainError::OLD_HEADER);
  EXPECT_EC(module_->submitFinalityProof(
                chain_[3], builder_.justify(chain_[3].blockInfo(), 3), 2),
            HeaderChainError::INVALID_AUTHORITY_SET_ID);
  EXPECT_EC(module_->submitFinalityProof(
                chain_[3], builder_.justify(chain_[3].blockInfo(), 2), 1),
            HeaderChainError::INVALID_JUSTIFICATION);

  EXPECT_OUTCOME_TRUE(best, module_->bestFinalized());
  EXPECT_EQ(*best, chain_[2].blockInfo());
}

/**
 * @given a halted module
 * @when a valid header is submitted
 * @then the call fails until the module is resumed
 */
TEST_F(HeaderChainModuleTest, HaltedModule) {
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  EXPECT_OUTCOME_TRUE_1(module_->setOperatingMode(BasicOperatingMode::HALTED));
  auto justification = builder_.justify(chain_[0].blockInfo(), 3);

  EXPECT_EC(module_->submitFinalityProof(chain_[0], justification, 1),
            HeaderChainError::HALTED);
  EXPECT_OUTCOME_TRUE_1(module_->setOperatingMode(BasicOperatingMode::NORMAL));
  EXPECT_OUTCOME_TRUE_1(
      module_->submitFinalityProof(chain_[0], justification, 1));
}

/**
 * @given a header scheduling an immediate authority set change
 * @when it is imported
 * @then the next set is enacted and the following header needs its votes
 */
TEST_F(HeaderChainModuleTest, EnactsScheduledChange) {
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  testutil::JustificationBuilder next{3, 2};

  auto header = chain_[0];
  EXPECT_OUTCOME_TRUE(
      digest,
      trestle::primitives::makeGrandpaDigest(GrandpaConsensusLog{
          ScheduledChange{.authorities = next.authoritySet().authorities,
                          .subchain_length = 0}}));
  header.digest.emplace_back(digest);
  trestle::primitives::calculateBlockHash(header, *builder_.hasher());

  EXPECT_OUTCOME_TRUE(
      info,
      module_->submitFinalityProof(
          header, builder_.justify(header.blockInfo(), 3), 1));
  EXPECT_TRUE(info.is_mandatory);
  EXPECT_OUTCOME_TRUE(set, module_->currentAuthoritySet());
  EXPECT_EQ(set.id, 2);
  EXPECT_EQ(set.authorities.size(), 3);

  auto following = next.chain(header.blockInfo(), 1);
  EXPECT_OUTCOME_TRUE_1(module_->submitFinalityProof(
      following[0], next.justify(following[0].blockInfo(), 3), 2));
}

/**
 * @given a module keeping 2 imported headers
 * @when 3 headers are imported
 * @then the oldest one is pruned
 */
TEST_F(HeaderChainModuleTest, PrunesImportedHeaders) {
  module_ = makeModule(HeaderChainConfig{.headers_to_keep = 2});
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  for (size_t i = 0; i < 2; ++i) {
    EXPECT_OUTCOME_TRUE_1(module_->submitFinalityProof(
        chain_[i], builder_.justify(chain_[i].blockInfo(), 3), 1));
  }

  EXPECT_OUTCOME_TRUE(genesis, module_->importedHeader(genesis_.hash()));
  EXPECT_FALSE(genesis.has_value());
  EXPECT_OUTCOME_TRUE(first, module_->importedHeader(chain_[0].hash()));
  EXPECT_TRUE(first.has_value());
  EXPECT_EC(module_->stateProofChecker(genesis_.hash(), {}),
            HeaderChainError::UNKNOWN_HEADER);
}

/**
 * @given an initialized module
 * @when the filter validates an obsolete and a fresh finality proof
 * @then the obsolete one is rejected without touching the module
 */
TEST_F(HeaderChainModuleTest, FilterRejectsObsoleteProofs) {
  EXPECT_OUTCOME_TRUE_1(module_->initialize(initData()));
  SubmitFinalityProofFilter filter{module_};

  SubmitFinalityProofCall obsolete{
      .finality_target = genesis_,
      .justification = builder_.justify(genesis_.blockInfo(), 3),
      .current_set_id = 1,
  };
  EXPECT_EC(filter.validate(obsolete), HeaderChainError::OLD_HEADER);

  SubmitFinalityProofCall fresh{
      .finality_target = chain_[4],
      .justification = builder_.justify(chain_[4].blockInfo(), 3),
      .current_set_id = 1,
  };
  EXPECT_OUTCOME_TRUE(info, filter.validate(fresh));
  EXPECT_EQ(info.block_number, 5);
  EXPECT_OUTCOME_TRUE(best, module_->bestFinalized());
  EXPECT_EQ(*best, genesis_.blockInfo());
}
