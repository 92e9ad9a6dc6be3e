/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "bridge/header_chain/header_chain_error.hpp"
#include "bridge/header_chain/types.hpp"
#include "log/logger.hpp"
#include "storage/state_proof/state_proof.hpp"
#include "storage/storage_item.hpp"

namespace trestle::bridge::header_chain {

  /**
   * On-chain light client of a GRANDPA chain. Imports finalized headers of
   * the bridged chain when their justifications are signed by the current
   * authority set, follows authority set changes and keeps the latest
   * imported headers so storage proofs can be checked against their state
   * roots.
   */
  class HeaderChainModule {
   public:
    static constexpr std::string_view kModuleName = "BridgeGrandpa";

    HeaderChainModule(
        std::shared_ptr<storage::BufferStorage> storage,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<consensus::grandpa::JustificationVerifier> verifier,
        HeaderChainConfig config);

    /**
     * Sets the initial finalized header and authority set
     */
    outcome::result<void> initialize(const InitializationData &data);

    /**
     * Imports a header finalized by the justification
     */
    outcome::result<SubmitFinalityProofInfo> submitFinalityProof(
        primitives::BlockHeader header,
        const consensus::grandpa::GrandpaJustification &justification,
        primitives::AuthoritySetId current_set_id);

    outcome::result<void> setOperatingMode(BasicOperatingMode mode);

    outcome::result<BasicOperatingMode> operatingMode() const;

    outcome::result<bool> isHalted() const;

    outcome::result<std::optional<BlockInfo>> bestFinalized() const;

    outcome::result<std::optional<StoredHeaderData>> importedHeader(
        const BlockHash &hash) const;

    /// @return current set or NOT_INITIALIZED
    outcome::result<primitives::AuthoritySet> currentAuthoritySet() const;

    /**
     * Reader of a storage proof made at the imported header
     * @return checker, UNKNOWN_HEADER or a state proof error
     */
    outcome::result<storage::StateProofChecker> stateProofChecker(
        const BlockHash &hash, const storage::StateProof &proof) const;

    /**
     * Set id the call must carry and the facts known about the call before
     * its dispatch
     */
    outcome::result<SubmitFinalityProofInfo> finalityProofInfo(
        const SubmitFinalityProofCall &call) const;

    const HeaderChainConfig &config() const {
      return config_;
    }

   private:
    outcome::result<void> ensureOperational() const;

    /// @return true if the set was changed
    outcome::result<bool> tryEnactAuthorityChange(
        const primitives::BlockHeader &header,
        const primitives::AuthoritySet &current_set);

    outcome::result<void> insertHeader(const primitives::BlockHeader &header);

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<consensus::grandpa::JustificationVerifier> verifier_;
    HeaderChainConfig config_;

    storage::StorageValue<BlockInfo> best_finalized_;
    storage::StorageMap<BlockHash, StoredHeaderData> imported_headers_;
    storage::StorageMap<uint32_t, BlockHash> imported_hashes_;
    storage::StorageValue<uint32_t> imported_hashes_pointer_;
    storage::StorageValue<primitives::AuthoritySet> current_authority_set_;
    storage::StorageValue<uint8_t> operating_mode_;

    log::Logger logger_;
  };

}  // namespace trestle::bridge::header_chain
