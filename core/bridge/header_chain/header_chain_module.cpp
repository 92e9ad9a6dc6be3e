/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/header_chain/header_chain_module.hpp"

#include "primitives/scheduled_change.hpp"

namespace trestle::bridge::header_chain {
  using consensus::grandpa::GrandpaJustification;
  using consensus::grandpa::VoterSet;

  HeaderChainModule::HeaderChainModule(
      std::shared_ptr<storage::BufferStorage> storage,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<consensus::grandpa::JustificationVerifier> verifier,
      HeaderChainConfig config)
      : hasher_{std::move(hasher)},
        verifier_{std::move(verifier)},
        config_{config},
        best_finalized_{storage, hasher_, kModuleName, "BestFinalized"},
        imported_headers_{storage, hasher_, kModuleName, "ImportedHeaders"},
        imported_hashes_{storage, hasher_, kModuleName, "ImportedHashes"},
        imported_hashes_pointer_{
            storage, hasher_, kModuleName, "ImportedHashesPointer"},
        current_authority_set_{
            storage, hasher_, kModuleName, "CurrentAuthoritySet"},
        operating_mode_{storage, hasher_, kModuleName, "PalletOperatingMode"},
        logger_{log::createLogger("HeaderChain", "header_chain")} {
    BOOST_ASSERT(verifier_ != nullptr);
    BOOST_ASSERT(config_.headers_to_keep > 0);
  }

  outcome::result<void> HeaderChainModule::initialize(
      const InitializationData &data) {
    OUTCOME_TRY(best, best_finalized_.tryGet());
    if (best) {
      return HeaderChainError::ALREADY_INITIALIZED;
    }
    if (data.authority_list.size() > config_.max_authorities) {
      return HeaderChainError::TOO_MANY_AUTHORITIES_IN_SET;
    }
    primitives::AuthoritySet set{data.set_id, data.authority_list};
    if (VoterSet::make(set).has_error()) {
      return HeaderChainError::INVALID_AUTHORITY_SET;
    }

    auto header = data.header;
    primitives::calculateBlockHash(header, *hasher_);
    OUTCOME_TRY(current_authority_set_.put(set));
    OUTCOME_TRY(insertHeader(header));
    OUTCOME_TRY(setOperatingMode(data.operating_mode));
    SL_INFO(logger_,
            "Initialized with header {} and authority set {} of {} authorities",
            header.blockInfo(),
            set.id,
            set.authorities.size());
    return outcome::success();
  }

  outcome::result<SubmitFinalityProofInfo>
  HeaderChainModule::submitFinalityProof(
      primitives::BlockHeader header,
      const GrandpaJustification &justification,
      primitives::AuthoritySetId current_set_id) {
    OUTCOME_TRY(ensureOperational());
    primitives::calculateBlockHash(header, *hasher_);

    SubmitFinalityProofCall call{
        .finality_target = header,
        .justification = justification,
        .current_set_id = current_set_id,
    };
    OUTCOME_TRY(info, finalityProofInfo(call));

    OUTCOME_TRY(header_size, scale::encodedSize(header));
    if (header_size > config_.max_header_size) {
      return HeaderChainError::HEADER_OVERFLOW_LIMITS;
    }

    OUTCOME_TRY(set, currentAuthoritySet());
    OUTCOME_TRY(voters, VoterSet::make(set));
    auto verified =
        verifier_->verify(header.blockInfo(), justification, *voters);
    if (verified.has_error()) {
      SL_DEBUG(logger_,
               "Justification of {} is rejected: {}",
               header.blockInfo(),
               verified.error());
      return HeaderChainError::INVALID_JUSTIFICATION;
    }

    OUTCOME_TRY(enacted, tryEnactAuthorityChange(header, set));
    OUTCOME_TRY(insertHeader(header));

    SL_DEBUG(logger_,
             "Imported finalized header {}{}",
             header.blockInfo(),
             enacted ? ", authority set changed" : "");
    info.is_mandatory = enacted;
    return info;
  }

  outcome::result<SubmitFinalityProofInfo> HeaderChainModule::finalityProofInfo(
      const SubmitFinalityProofCall &call) const {
    OUTCOME_TRY(best, bestFinalized());
    if (not best) {
      return HeaderChainError::NOT_INITIALIZED;
    }
    if (call.finality_target.number <= best->number) {
      return HeaderChainError::OLD_HEADER;
    }
    OUTCOME_TRY(set, currentAuthoritySet());
    if (call.current_set_id != set.id) {
      return HeaderChainError::INVALID_AUTHORITY_SET_ID;
    }

    SubmitFinalityProofInfo info{
        .block_number = call.finality_target.number,
        .current_set_id = set.id,
        .is_mandatory =
            primitives::findScheduledChange(call.finality_target).has_value(),
        .extra_size = 0,
    };
    OUTCOME_TRY(justification_size, scale::encodedSize(call.justification));
    auto required =
        consensus::grandpa::requiredVotes(
            static_cast<uint32_t>(set.authorities.size()));
    auto reasonable_size = consensus::grandpa::maxReasonableSize(
        required, config_.justification_limits);
    if (justification_size > reasonable_size) {
      info.extra_size =
          static_cast<uint32_t>(justification_size - reasonable_size);
    }
    return info;
  }

  outcome::result<void> HeaderChainModule::setOperatingMode(
      BasicOperatingMode mode) {
    OUTCOME_TRY(operating_mode_.put(static_cast<uint8_t>(mode)));
    SL_INFO(logger_,
            "Operating mode is {}",
            mode == BasicOperatingMode::HALTED ? "halted" : "normal");
    return outcome::success();
  }

  outcome::result<BasicOperatingMode> HeaderChainModule::operatingMode() const {
    OUTCOME_TRY(mode, operating_mode_.getOrDefault());
    switch (static_cast<BasicOperatingMode>(mode)) {
      case BasicOperatingMode::NORMAL:
      case BasicOperatingMode::HALTED:
        return static_cast<BasicOperatingMode>(mode);
    }
    return HeaderChainError::INVALID_OPERATING_MODE;
  }

  outcome::result<bool> HeaderChainModule::isHalted() const {
    OUTCOME_TRY(mode, operatingMode());
    return mode == BasicOperatingMode::HALTED;
  }

  outcome::result<std::optional<BlockInfo>> HeaderChainModule::bestFinalized()
      const {
    return best_finalized_.tryGet();
  }

  outcome::result<std::optional<StoredHeaderData>>
  HeaderChainModule::importedHeader(const BlockHash &hash) const {
    return imported_headers_.tryGet(hash);
  }

  outcome::result<primitives::AuthoritySet>
  HeaderChainModule::currentAuthoritySet() const {
    OUTCOME_TRY(set, current_authority_set_.tryGet());
    if (not set) {
      return HeaderChainError::NOT_INITIALIZED;
    }
    return std::move(*set);
  }

  outcome::result<storage::StateProofChecker>
  HeaderChainModule::stateProofChecker(const BlockHash &hash,
                                       const storage::StateProof &proof) const {
    OUTCOME_TRY(header, importedHeader(hash));
    if (not header) {
      return HeaderChainError::UNKNOWN_HEADER;
    }
    return storage::StateProofChecker::create(
        *hasher_, header->state_root, proof);
  }

  outcome::result<void> HeaderChainModule::ensureOperational() const {
    OUTCOME_TRY(halted, isHalted());
    if (halted) {
      return HeaderChainError::HALTED;
    }
    return outcome::success();
  }

  outcome::result<bool> HeaderChainModule::tryEnactAuthorityChange(
      const primitives::BlockHeader &header,
      const primitives::AuthoritySet &current_set) {
    if (primitives::findForcedChange(header)) {
      return HeaderChainError::UNSUPPORTED_SCHEDULED_CHANGE;
    }
    auto change = primitives::findScheduledChange(header);
    if (not change) {
      return false;
    }
    if (change->subchain_length != 0) {
      return HeaderChainError::UNSUPPORTED_SCHEDULED_CHANGE;
    }
    if (change->authorities.size() > config_.max_authorities) {
      return HeaderChainError::TOO_MANY_AUTHORITIES_IN_SET;
    }
    primitives::AuthoritySet next_set{current_set.id + 1, change->authorities};
    if (VoterSet::make(next_set).has_error()) {
      return HeaderChainError::INVALID_AUTHORITY_SET;
    }
    OUTCOME_TRY(current_authority_set_.put(next_set));
    SL_INFO(logger_,
            "Authority set {} of {} authorities is enacted at {}",
            next_set.id,
            next_set.authorities.size(),
            header.blockInfo());
    return true;
  }

  outcome::result<void> HeaderChainModule::insertHeader(
      const primitives::BlockHeader &header) {
    OUTCOME_TRY(pointer, imported_hashes_pointer_.getOrDefault());
    OUTCOME_TRY(pruned, imported_hashes_.tryGet(pointer));
    if (pruned) {
      OUTCOME_TRY(imported_headers_.remove(*pruned));
      SL_TRACE(logger_, "Pruned imported header {}", *pruned);
    }
    OUTCOME_TRY(imported_headers_.put(
        header.hash(),
        StoredHeaderData{.number = header.number,
                         .state_root = header.state_root}));
    OUTCOME_TRY(imported_hashes_.put(pointer, header.hash()));
    OUTCOME_TRY(imported_hashes_pointer_.put((pointer + 1)
                                             % config_.headers_to_keep));
    OUTCOME_TRY(best_finalized_.put(header.blockInfo()));
    return outcome::success();
  }

}  // namespace trestle::bridge::header_chain
