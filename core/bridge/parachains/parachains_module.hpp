/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/header_chain/header_chain_module.hpp"
#include "bridge/parachains/parachains_error.hpp"
#include "bridge/parachains/types.hpp"

namespace trestle::bridge::parachains {

  /**
   * Tracks heads of parachains of the bridged relay chain. Heads are read
   * from storage proofs of the `Paras` module, made at relay chain headers
   * imported by the header chain module.
   */
  class ParachainsModule {
   public:
    static constexpr std::string_view kModuleName = "BridgeParachains";

    ParachainsModule(
        std::shared_ptr<storage::BufferStorage> storage,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<const header_chain::HeaderChainModule> relay_chain,
        ParachainsConfig config);

    /**
     * Imports the heads proven at the relay chain block. Heads, which are
     * missing in the proof, mismatch the claimed hash, are too large or are
     * not newer than the stored ones, are skipped. Nothing is stored when
     * the proof is rejected.
     */
    outcome::result<SubmitParachainHeadsInfo> submitParachainHeads(
        const BlockInfo &at_relay_block,
        const std::vector<ParaHeadUpdate> &parachains,
        const storage::StateProof &heads_proof);

    outcome::result<std::optional<ParaInfo>> bestParaHead(
        ParaId para_id) const;

    outcome::result<std::optional<ParaHead>> importedParaHead(
        ParaId para_id, const ParaHash &hash) const;

    outcome::result<std::optional<ParaHead>> bestParaHeadData(
        ParaId para_id) const;

   private:
    struct PendingHead {
      ParaId para_id;
      ParaHash head_hash;
      ParaHead head;
      ParaInfo info;
    };

    /// @return the head to import, or nothing if it is skipped
    outcome::result<std::optional<PendingHead>> checkHead(
        ParaId para_id,
        BlockNumber at_relay_block_number,
        const ParaHash &head_hash,
        const std::optional<ParaHead> &head) const;

    outcome::result<void> applyHead(PendingHead &head,
                                    BlockNumber at_relay_block_number);

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<const header_chain::HeaderChainModule> relay_chain_;
    ParachainsConfig config_;

    storage::StorageMap<ParaId, ParaInfo> paras_info_;
    storage::StorageMap<ParaKey<ParaHash>, ParaHead> imported_heads_;
    storage::StorageMap<ParaKey<uint32_t>, ParaHash> imported_hashes_;

    log::Logger logger_;
  };

}  // namespace trestle::bridge::parachains
