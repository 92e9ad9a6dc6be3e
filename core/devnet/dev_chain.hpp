/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "bridge/header_chain/header_chain_module.hpp"
#include "bridge/messages/messages_module.hpp"
#include "bridge/parachains/parachains_module.hpp"
#include "bridge/parachains/paras_registry.hpp"
#include "bridge/relayers/delivery_confirmation_payments_adapter.hpp"
#include "bridge/relayers/relayers_ledger.hpp"
#include "devnet/dev_capabilities.hpp"
#include "primitives/runtime_version.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace trestle::devnet {

  struct DevChainConfig {
    std::string name;
    bridge::ChainId chain_id;
    /// Chain whose headers, parachains and messages this chain receives
    bridge::ChainId bridged_chain_id;
    uint32_t authorities = 4;
    /// Every n-th block is finalized with a justification
    uint32_t justification_period = 4;
    /// Authority set is changed every n blocks, never if 0
    uint32_t authority_set_change_period = 0;
    primitives::RuntimeVersion runtime_version;
    bridge::messages::MessagesConfig messages;
    bridge::relayers::RewardsConfig rewards;
    bridge::messages::Weight dispatch_weight_per_message = 1000;
    /// States of older blocks can't be proven
    size_t states_to_keep = 256;
  };

  struct DevBlock {
    primitives::BlockHeader header;
    std::optional<consensus::grandpa::GrandpaJustification> justification;
    /// Empty once pruned
    std::shared_ptr<storage::InMemoryStorage> state;
  };

  /**
   * Single node development chain. Transactions are applied to the state at
   * once, a block commits to the state it is produced on. Every block is
   * final, but only some of them have justifications.
   */
  class DevChain {
   public:
    DevChain(DevChainConfig config,
             std::shared_ptr<crypto::Hasher> hasher,
             std::shared_ptr<crypto::Ed25519Provider> ed25519_provider);

    const DevChainConfig &config() const {
      return config_;
    }

    const std::string &name() const {
      return config_.name;
    }

    /// Produces the genesis block first
    outcome::result<DevBlock> produceBlock();

    /// Data to initialize the header chain module of the bridged chain
    outcome::result<bridge::header_chain::InitializationData>
    initializationData() const;

    /// Starts tracking the bridged chain, opens the messages module
    outcome::result<void> initializeBridge(
        const bridge::header_chain::InitializationData &bridged);

    /// Number of the best block, genesis if none
    primitives::BlockNumber bestNumber() const;

    /// Latest block with a justification
    primitives::BlockInfo bestFinalized() const;

    std::optional<DevBlock> block(primitives::BlockNumber number) const;

    /// State committed by the block, empty if unknown or pruned
    std::shared_ptr<storage::InMemoryStorage> stateAt(
        const primitives::BlockHash &hash) const;

    bool connected() const {
      return connected_;
    }

    void setConnected(bool connected);

    const primitives::RuntimeVersion &runtimeVersion() const {
      return config_.runtime_version;
    }

    void setRuntimeVersion(primitives::RuntimeVersion version);

    const std::shared_ptr<crypto::Hasher> &hasher() const {
      return hasher_;
    }

    const std::shared_ptr<bridge::header_chain::HeaderChainModule> &
    headerChain() const {
      return header_chain_;
    }

    const std::shared_ptr<bridge::parachains::ParasRegistry> &parasRegistry()
        const {
      return paras_registry_;
    }

    const std::shared_ptr<bridge::parachains::ParachainsModule> &parachains()
        const {
      return parachains_;
    }

    const std::shared_ptr<bridge::messages::MessagesModule> &messages() const {
      return messages_;
    }

    const std::shared_ptr<bridge::relayers::RelayersLedger> &relayersLedger()
        const {
      return relayers_ledger_;
    }

    const std::shared_ptr<DevMessageDispatch> &dispatch() const {
      return dispatch_;
    }

    const std::shared_ptr<DevPaymentProcedure> &paymentProcedure() const {
      return payment_procedure_;
    }

   private:
    std::vector<crypto::Ed25519Keypair> makeAuthorities(
        primitives::AuthoritySetId set_id) const;

    primitives::AuthorityList authorityList() const;

    outcome::result<consensus::grandpa::GrandpaJustification> justify(
        const primitives::BlockHeader &header) const;

    DevChainConfig config_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;

    std::shared_ptr<storage::InMemoryStorage> state_;
    std::vector<DevBlock> blocks_;
    std::map<primitives::BlockHash, primitives::BlockNumber> numbers_;
    primitives::BlockNumber finalized_ = 0;

    primitives::AuthoritySetId set_id_ = 0;
    std::vector<crypto::Ed25519Keypair> authorities_;
    bool connected_ = true;

    std::shared_ptr<bridge::header_chain::HeaderChainModule> header_chain_;
    std::shared_ptr<bridge::parachains::ParasRegistry> paras_registry_;
    std::shared_ptr<bridge::parachains::ParachainsModule> parachains_;
    std::shared_ptr<DevMessageDispatch> dispatch_;
    std::shared_ptr<DevPaymentProcedure> payment_procedure_;
    std::shared_ptr<bridge::relayers::RelayersLedger> relayers_ledger_;
    std::shared_ptr<bridge::messages::MessagesModule> messages_;

    log::Logger logger_;
  };

}  // namespace trestle::devnet
