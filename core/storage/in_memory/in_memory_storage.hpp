/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "storage/buffer_storage.hpp"

namespace trestle::storage {

  /**
   * Simple storage that keeps everything in an ordered map.
   * Backs the state of development chains and the tests; copies are
   * independent snapshots.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    using Entries = std::map<Buffer, Buffer>;

    ~InMemoryStorage() override = default;

    outcome::result<bool> contains(const BufferView &key) const override;

    bool empty() const override;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

    outcome::result<std::vector<Buffer>> keysWithPrefix(
        const BufferView &prefix) const override;

    const Entries &entries() const {
      return storage_;
    }

   private:
    Entries storage_;
  };

}  // namespace trestle::storage
