/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bridge/parachains/types.hpp"
#include "log/logger.hpp"
#include "storage/storage_item.hpp"

namespace trestle::bridge::parachains {

  /**
   * Heads of the parachains as known to their relay chain. Lives in the
   * relay chain state, so the heads can be proven to the bridged chain.
   */
  class ParasRegistry {
   public:
    static constexpr std::string_view kModuleName = "Paras";

    ParasRegistry(std::shared_ptr<storage::BufferStorage> storage,
                  std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<void> setHead(ParaId para_id, const ParaHead &head);

    outcome::result<std::optional<ParaHead>> head(ParaId para_id) const;

    outcome::result<std::vector<ParaId>> paras() const;

    /// Storage key of the para head, to be proven
    static outcome::result<common::Buffer> headKey(const crypto::Hasher &hasher,
                                                   ParaId para_id);

   private:
    storage::StorageMap<ParaId, ParaHead> heads_;
    log::Logger logger_;
  };

}  // namespace trestle::bridge::parachains
