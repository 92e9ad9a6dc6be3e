/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/parachains/parachains_module.hpp"

#include <algorithm>

#include "bridge/parachains/paras_registry.hpp"

namespace trestle::bridge::parachains {

  ParachainsModule::ParachainsModule(
      std::shared_ptr<storage::BufferStorage> storage,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<const header_chain::HeaderChainModule> relay_chain,
      ParachainsConfig config)
      : hasher_{std::move(hasher)},
        relay_chain_{std::move(relay_chain)},
        config_{config},
        paras_info_{storage, hasher_, kModuleName, "ParasInfo"},
        imported_heads_{storage, hasher_, kModuleName, "ImportedParaHeads"},
        imported_hashes_{storage, hasher_, kModuleName, "ImportedParaHashes"},
        logger_{log::createLogger("Parachains", "parachains")} {
    BOOST_ASSERT(relay_chain_ != nullptr);
    BOOST_ASSERT(config_.heads_to_keep > 0);
  }

  outcome::result<SubmitParachainHeadsInfo>
  ParachainsModule::submitParachainHeads(
      const BlockInfo &at_relay_block,
      const std::vector<ParaHeadUpdate> &parachains,
      const storage::StateProof &heads_proof) {
    OUTCOME_TRY(relay_header,
                relay_chain_->importedHeader(at_relay_block.hash));
    if (not relay_header) {
      return ParachainsError::UNKNOWN_RELAY_CHAIN_BLOCK;
    }
    if (relay_header->number != at_relay_block.number) {
      return ParachainsError::INVALID_RELAY_CHAIN_BLOCK_NUMBER;
    }
    OUTCOME_TRY(checker,
                relay_chain_->stateProofChecker(at_relay_block.hash,
                                                heads_proof));

    // nothing is written until the whole proof is checked
    SubmitParachainHeadsInfo info;
    std::vector<PendingHead> pending;
    for (const auto &update : parachains) {
      OUTCOME_TRY(key, ParasRegistry::headKey(*hasher_, update.para_id));
      auto head = checker.readAndDecodeValue<ParaHead>(key);
      if (head.has_error()) {
        SL_DEBUG(logger_,
                 "Head of para {} in the proof can't be decoded: {}",
                 update.para_id,
                 head.error());
        ++info.skipped;
        continue;
      }
      auto duplicate =
          std::ranges::any_of(pending, [&](const PendingHead &accepted) {
            return accepted.para_id == update.para_id;
          });
      if (duplicate) {
        SL_DEBUG(logger_,
                 "Head of para {} is submitted twice in one call",
                 update.para_id);
        ++info.skipped;
        continue;
      }
      OUTCOME_TRY(accepted,
                  checkHead(update.para_id,
                            at_relay_block.number,
                            update.head_hash,
                            head.value()));
      if (accepted) {
        pending.emplace_back(std::move(*accepted));
      } else {
        ++info.skipped;
      }
    }

    OUTCOME_TRY(checker.ensureNoUnusedEntries());

    for (auto &head : pending) {
      OUTCOME_TRY(applyHead(head, at_relay_block.number));
      ++info.accepted;
    }
    return info;
  }

  outcome::result<std::optional<ParachainsModule::PendingHead>>
  ParachainsModule::checkHead(ParaId para_id,
                              BlockNumber at_relay_block_number,
                              const ParaHash &head_hash,
                              const std::optional<ParaHead> &head) const {
    if (not head) {
      SL_DEBUG(logger_, "Head of para {} is missing in the proof", para_id);
      return std::nullopt;
    }
    auto actual_hash = hasher_->blake2b_256(*head);
    if (actual_hash != head_hash) {
      SL_DEBUG(logger_,
               "Head of para {} has hash {}, while {} is claimed",
               para_id,
               actual_hash,
               head_hash);
      return std::nullopt;
    }
    if (head->size() > config_.max_para_head_data_size) {
      SL_DEBUG(logger_,
               "Head of para {} is too large: {} bytes",
               para_id,
               head->size());
      return std::nullopt;
    }

    OUTCOME_TRY(stored, paras_info_.tryGet(para_id));
    if (stored) {
      const auto &best = stored->best_head_hash;
      if (best.at_relay_block_number >= at_relay_block_number) {
        SL_DEBUG(logger_,
                 "Head of para {} at relay block #{} is obsolete, "
                 "stored head is at #{}",
                 para_id,
                 at_relay_block_number,
                 best.at_relay_block_number);
        return std::nullopt;
      }
      if (best.head_hash == head_hash) {
        SL_DEBUG(logger_,
                 "Head {} of para {} is already known",
                 head_hash,
                 para_id);
        return std::nullopt;
      }
    }
    return PendingHead{
        .para_id = para_id,
        .head_hash = head_hash,
        .head = *head,
        .info = stored.value_or(ParaInfo{}),
    };
  }

  outcome::result<void> ParachainsModule::applyHead(
      PendingHead &head, BlockNumber at_relay_block_number) {
    const auto para_id = head.para_id;
    auto &info = head.info;
    auto position = info.next_imported_hash_position;
    OUTCOME_TRY(
        pruned,
        imported_hashes_.tryGet({.para_id = para_id, .value = position}));
    if (pruned) {
      OUTCOME_TRY(
          imported_heads_.remove({.para_id = para_id, .value = *pruned}));
    }
    OUTCOME_TRY(imported_heads_.put(
        {.para_id = para_id, .value = head.head_hash}, head.head));
    OUTCOME_TRY(imported_hashes_.put({.para_id = para_id, .value = position},
                                     head.head_hash));

    info.best_head_hash = BestParaHeadHash{
        .at_relay_block_number = at_relay_block_number,
        .head_hash = head.head_hash,
    };
    info.next_imported_hash_position = (position + 1) % config_.heads_to_keep;
    OUTCOME_TRY(paras_info_.put(para_id, info));

    SL_VERBOSE(logger_,
               "Head {} of para {} at relay block #{} is imported",
               head.head_hash,
               para_id,
               at_relay_block_number);
    return outcome::success();
  }

  outcome::result<std::optional<ParaInfo>> ParachainsModule::bestParaHead(
      ParaId para_id) const {
    return paras_info_.tryGet(para_id);
  }

  outcome::result<std::optional<ParaHead>> ParachainsModule::importedParaHead(
      ParaId para_id, const ParaHash &hash) const {
    return imported_heads_.tryGet({.para_id = para_id, .value = hash});
  }

  outcome::result<std::optional<ParaHead>> ParachainsModule::bestParaHeadData(
      ParaId para_id) const {
    OUTCOME_TRY(info, bestParaHead(para_id));
    if (not info) {
      return std::nullopt;
    }
    return importedParaHead(para_id, info->best_head_hash.head_hash);
  }

}  // namespace trestle::bridge::parachains
