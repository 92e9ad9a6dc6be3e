/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/header_chain/submit_finality_proof_filter.hpp"

namespace trestle::bridge::header_chain {

  SubmitFinalityProofFilter::SubmitFinalityProofFilter(
      std::shared_ptr<const HeaderChainModule> header_chain)
      : header_chain_{std::move(header_chain)},
        logger_{
            log::createLogger("SubmitFinalityProofFilter", "header_chain")} {
    BOOST_ASSERT(header_chain_ != nullptr);
  }

  outcome::result<SubmitFinalityProofInfo> SubmitFinalityProofFilter::validate(
      const SubmitFinalityProofCall &call) const {
    OUTCOME_TRY(halted, header_chain_->isHalted());
    if (halted) {
      return HeaderChainError::HALTED;
    }
    auto info = header_chain_->finalityProofInfo(call);
    if (info.has_error()) {
      SL_TRACE(logger_,
               "Finality proof of #{} is rejected: {}",
               call.finality_target.number,
               info.error());
      return info.as_failure();
    }
    if (info.value().extra_size > 0) {
      SL_DEBUG(logger_,
               "Justification of #{} is {} bytes larger than reasonable",
               call.finality_target.number,
               info.value().extra_size);
    }
    return info;
  }

}  // namespace trestle::bridge::header_chain
