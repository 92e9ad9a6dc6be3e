/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "devnet/dev_chain.hpp"

#include "consensus/grandpa/vote_crypto.hpp"
#include "primitives/scheduled_change.hpp"
#include "storage/state_proof/state_proof.hpp"

namespace trestle::devnet {

  DevChain::DevChain(DevChainConfig config,
                     std::shared_ptr<crypto::Hasher> hasher,
                     std::shared_ptr<crypto::Ed25519Provider> ed25519_provider)
      : config_{std::move(config)},
        hasher_{std::move(hasher)},
        ed25519_provider_{std::move(ed25519_provider)},
        state_{std::make_shared<storage::InMemoryStorage>()},
        logger_{log::createLogger("DevChain", "devnet")} {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(ed25519_provider_ != nullptr);

    authorities_ = makeAuthorities(set_id_);

    auto verifier = std::make_shared<consensus::grandpa::JustificationVerifier>(
        ed25519_provider_, hasher_);
    header_chain_ = std::make_shared<bridge::header_chain::HeaderChainModule>(
        state_, hasher_, verifier, bridge::header_chain::HeaderChainConfig{});
    paras_registry_ =
        std::make_shared<bridge::parachains::ParasRegistry>(state_, hasher_);
    parachains_ = std::make_shared<bridge::parachains::ParachainsModule>(
        state_,
        hasher_,
        header_chain_,
        bridge::parachains::ParachainsConfig{});
    dispatch_ = std::make_shared<DevMessageDispatch>(
        config_.dispatch_weight_per_message);
    payment_procedure_ = std::make_shared<DevPaymentProcedure>();
    relayers_ledger_ = std::make_shared<bridge::relayers::RelayersLedger>(
        state_, hasher_, payment_procedure_);
    messages_ = std::make_shared<bridge::messages::MessagesModule>(
        state_,
        hasher_,
        header_chain_,
        dispatch_,
        std::make_shared<bridge::relayers::DeliveryConfirmationPaymentsAdapter>(
            relayers_ledger_, config_.bridged_chain_id, config_.rewards),
        nullptr,
        config_.messages);
  }

  std::vector<crypto::Ed25519Keypair> DevChain::makeAuthorities(
      primitives::AuthoritySetId set_id) const {
    std::vector<crypto::Ed25519Keypair> keys;
    keys.reserve(config_.authorities);
    for (uint32_t i = 0; i < config_.authorities; ++i) {
      auto phrase = fmt::format("//{}//{}//{}", config_.name, set_id, i);
      crypto::Ed25519Seed seed{
          hasher_->blake2b_256(common::Buffer::fromString(phrase))};
      keys.emplace_back(ed25519_provider_->generateKeypair(seed));
    }
    return keys;
  }

  primitives::AuthorityList DevChain::authorityList() const {
    primitives::AuthorityList list;
    for (auto &keypair : authorities_) {
      list.emplace_back(
          primitives::Authority{.id = keypair.public_key, .weight = 1});
    }
    return list;
  }

  outcome::result<consensus::grandpa::GrandpaJustification> DevChain::justify(
      const primitives::BlockHeader &header) const {
    consensus::grandpa::GrandpaJustification justification{
        .round = header.number,
        .commit = {.target_hash = header.hash(),
                   .target_number = header.number},
    };
    consensus::grandpa::VoteCrypto vote_crypto{
        ed25519_provider_, justification.round, set_id_};
    // every authority votes, so the relay has something to optimize
    for (auto &keypair : authorities_) {
      OUTCOME_TRY(signed_precommit,
                  vote_crypto.signPrecommit(
                      keypair,
                      consensus::grandpa::Precommit{header.number,
                                                    header.hash()}));
      justification.commit.precommits.emplace_back(std::move(signed_precommit));
    }
    return justification;
  }

  outcome::result<DevBlock> DevChain::produceBlock() {
    primitives::BlockHeader header;
    if (not blocks_.empty()) {
      header.number = blocks_.back().header.number + 1;
      header.parent_hash = blocks_.back().header.hash();
    }
    OUTCOME_TRY(state_root, storage::stateRoot(*state_, *hasher_));
    header.state_root = state_root;

    bool changes_set = header.number != 0
                   and config_.authority_set_change_period != 0
                   and header.number % config_.authority_set_change_period == 0;
    std::vector<crypto::Ed25519Keypair> next_authorities;
    if (changes_set) {
      next_authorities = makeAuthorities(set_id_ + 1);
      primitives::ScheduledChange change;
      for (auto &keypair : next_authorities) {
        change.authorities.emplace_back(
            primitives::Authority{.id = keypair.public_key, .weight = 1});
      }
      OUTCOME_TRY(digest,
                  primitives::makeGrandpaDigest({.value = std::move(change)}));
      header.digest.emplace_back(std::move(digest));
    }
    primitives::calculateBlockHash(header, *hasher_);

    DevBlock block{
        .header = header,
        .state = std::make_shared<storage::InMemoryStorage>(*state_),
    };
    if (header.number != 0
        and (changes_set or config_.justification_period == 0
             or header.number % config_.justification_period == 0)) {
      OUTCOME_TRY(justification, justify(header));
      block.justification = std::move(justification);
      finalized_ = header.number;
    }
    if (changes_set) {
      authorities_ = std::move(next_authorities);
      ++set_id_;
      SL_INFO(logger_,
              "{}: authority set {} is enacted at {}",
              config_.name,
              set_id_,
              header.blockInfo());
    }

    numbers_.emplace(header.hash(), header.number);
    blocks_.emplace_back(block);
    if (blocks_.size() > config_.states_to_keep) {
      blocks_[blocks_.size() - config_.states_to_keep - 1].state.reset();
    }
    SL_DEBUG(logger_,
             "{}: produced block {}{}",
             config_.name,
             header.blockInfo(),
             block.justification ? " with justification" : "");
    return block;
  }

  outcome::result<bridge::header_chain::InitializationData>
  DevChain::initializationData() const {
    if (blocks_.empty()) {
      return bridge::header_chain::HeaderChainError::UNKNOWN_HEADER;
    }
    auto &last = blocks_.at(finalized_);
    return bridge::header_chain::InitializationData{
        .header = last.header,
        .authority_list = authorityList(),
        .set_id = set_id_,
    };
  }

  outcome::result<void> DevChain::initializeBridge(
      const bridge::header_chain::InitializationData &bridged) {
    OUTCOME_TRY(header_chain_->initialize(bridged));
    OUTCOME_TRY(
        messages_->initialize(bridge::messages::MessagesOperatingMode::NORMAL));
    SL_INFO(logger_,
            "{}: bridged chain is tracked from {}",
            config_.name,
            bridged.header.number);
    return outcome::success();
  }

  primitives::BlockNumber DevChain::bestNumber() const {
    return blocks_.empty() ? 0 : blocks_.back().header.number;
  }

  primitives::BlockInfo DevChain::bestFinalized() const {
    if (blocks_.empty()) {
      return {};
    }
    return blocks_.at(finalized_).header.blockInfo();
  }

  std::optional<DevBlock> DevChain::block(
      primitives::BlockNumber number) const {
    if (number >= blocks_.size()) {
      return std::nullopt;
    }
    return blocks_[number];
  }

  std::shared_ptr<storage::InMemoryStorage> DevChain::stateAt(
      const primitives::BlockHash &hash) const {
    auto it = numbers_.find(hash);
    if (it == numbers_.end()) {
      return nullptr;
    }
    return blocks_[it->second].state;
  }

  void DevChain::setConnected(bool connected) {
    if (connected_ != connected) {
      SL_INFO(logger_,
              "{}: node is {}",
              config_.name,
              connected ? "reachable" : "unreachable");
    }
    connected_ = connected;
  }

  void DevChain::setRuntimeVersion(primitives::RuntimeVersion version) {
    SL_INFO(logger_,
            "{}: runtime upgraded from {} to {}",
            config_.name,
            config_.runtime_version,
            version);
    config_.runtime_version = std::move(version);
  }

}  // namespace trestle::devnet
