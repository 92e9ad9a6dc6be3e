/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/parachains/paras_registry.hpp"

namespace trestle::bridge::parachains {

  ParasRegistry::ParasRegistry(std::shared_ptr<storage::BufferStorage> storage,
                               std::shared_ptr<crypto::Hasher> hasher)
      : heads_{std::move(storage), std::move(hasher), kModuleName, "Heads"},
        logger_{log::createLogger("ParasRegistry", "parachains")} {}

  outcome::result<void> ParasRegistry::setHead(ParaId para_id,
                                               const ParaHead &head) {
    SL_TRACE(logger_, "Head of para {} is {}", para_id, head);
    return heads_.put(para_id, head);
  }

  outcome::result<std::optional<ParaHead>> ParasRegistry::head(
      ParaId para_id) const {
    return heads_.tryGet(para_id);
  }

  outcome::result<std::vector<ParaId>> ParasRegistry::paras() const {
    return heads_.keys();
  }

  outcome::result<common::Buffer> ParasRegistry::headKey(
      const crypto::Hasher &hasher, ParaId para_id) {
    return storage::storageMapKey(
        hasher, storage::storagePrefix(hasher, kModuleName, "Heads"), para_id);
  }

}  // namespace trestle::bridge::parachains
