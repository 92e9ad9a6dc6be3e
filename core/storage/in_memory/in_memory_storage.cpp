/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/database_error.hpp"

namespace trestle::storage {

  outcome::result<bool> InMemoryStorage::contains(const BufferView &key) const {
    return storage_.find(Buffer{key}) != storage_.end();
  }

  bool InMemoryStorage::empty() const {
    return storage_.empty();
  }

  outcome::result<Buffer> InMemoryStorage::get(const BufferView &key) const {
    if (auto it = storage_.find(Buffer{key}); it != storage_.end()) {
      return it->second;
    }
    return DatabaseError::NOT_FOUND;
  }

  outcome::result<std::optional<Buffer>> InMemoryStorage::tryGet(
      const BufferView &key) const {
    if (auto it = storage_.find(Buffer{key}); it != storage_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const BufferView &key,
                                             Buffer value) {
    storage_[Buffer{key}] = std::move(value);
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(const BufferView &key) {
    storage_.erase(Buffer{key});
    return outcome::success();
  }

  outcome::result<std::vector<Buffer>> InMemoryStorage::keysWithPrefix(
      const BufferView &prefix) const {
    std::vector<Buffer> keys;
    for (auto it = storage_.lower_bound(Buffer{prefix});
         it != storage_.end() and common::startsWith(it->first, prefix);
         ++it) {
      keys.push_back(it->first);
    }
    return keys;
  }

}  // namespace trestle::storage
