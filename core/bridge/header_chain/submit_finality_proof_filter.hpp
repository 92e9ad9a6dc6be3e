/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/header_chain/header_chain_module.hpp"

namespace trestle::bridge::header_chain {

  /**
   * Pre-dispatch check of finality proof transactions: obsolete headers and
   * proofs for another authority set are rejected before the costly
   * justification verification
   */
  class SubmitFinalityProofFilter {
   public:
    explicit SubmitFinalityProofFilter(
        std::shared_ptr<const HeaderChainModule> header_chain);

    /**
     * @return facts about the call, or the error the dispatch would fail with
     */
    outcome::result<SubmitFinalityProofInfo> validate(
        const SubmitFinalityProofCall &call) const;

   private:
    std::shared_ptr<const HeaderChainModule> header_chain_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::header_chain
