/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/parachains/parachains_module.hpp"

namespace trestle::bridge::parachains {

  /**
   * Pre-dispatch check of parachain heads transactions. An update of a
   * single parachain is rejected as STALE unless it is read at a relay
   * block newer than the stored head and brings another head. Batches of
   * several parachains are left to the dispatch.
   * Accepting a call proves nothing about its validity.
   */
  class ParaHeadAdmissionFilter {
   public:
    explicit ParaHeadAdmissionFilter(
        std::shared_ptr<const ParachainsModule> parachains);

    outcome::result<void> validate(const SubmitParachainHeadsCall &call) const;

   private:
    std::shared_ptr<const ParachainsModule> parachains_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::parachains
