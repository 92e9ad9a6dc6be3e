/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include "crypto/hasher.hpp"
#include "scale/trestle_scale.hpp"
#include "storage/buffer_storage.hpp"
#include "storage/database_error.hpp"

namespace trestle::storage {

  /**
   * Key prefix of a storage item of a runtime module:
   * blake2b_128(module) ++ blake2b_128(item)
   */
  inline Buffer storagePrefix(const crypto::Hasher &hasher,
                              std::string_view module,
                              std::string_view item) {
    Buffer prefix;
    prefix.put(hasher.blake2b_128(Buffer::fromString(module)));
    prefix.put(hasher.blake2b_128(Buffer::fromString(item)));
    return prefix;
  }

  /**
   * Key of a map entry: prefix ++ blake2b_128(encoded key) ++ encoded key
   */
  template <typename K>
  outcome::result<Buffer> storageMapKey(const crypto::Hasher &hasher,
                                        const Buffer &prefix,
                                        const K &k) {
    OUTCOME_TRY(encoded, scale::encode(k));
    Buffer key{prefix};
    key.put(hasher.blake2b_128(encoded));
    key.put(encoded);
    return key;
  }

  /**
   * Single SCALE-encoded value stored under a fixed key
   */
  template <typename T>
  class StorageValue {
   public:
    StorageValue(std::shared_ptr<BufferStorage> storage,
                 const std::shared_ptr<crypto::Hasher> &hasher,
                 std::string_view module,
                 std::string_view item)
        : storage_{std::move(storage)},
          key_{storagePrefix(*hasher, module, item)} {}

    const Buffer &key() const {
      return key_;
    }

    outcome::result<std::optional<T>> tryGet() const {
      OUTCOME_TRY(raw, storage_->tryGet(key_));
      if (not raw) {
        return std::nullopt;
      }
      OUTCOME_TRY(value, scale::decode<T>(*raw));
      return std::optional<T>{std::move(value)};
    }

    /// @return value or DatabaseError::NOT_FOUND
    outcome::result<T> get() const {
      OUTCOME_TRY(value, tryGet());
      if (not value) {
        return DatabaseError::NOT_FOUND;
      }
      return std::move(*value);
    }

    outcome::result<T> getOrDefault() const {
      OUTCOME_TRY(value, tryGet());
      return value.value_or(T{});
    }

    outcome::result<void> put(const T &value) {
      OUTCOME_TRY(raw, scale::encode(value));
      return storage_->put(key_, std::move(raw));
    }

    outcome::result<void> remove() {
      return storage_->remove(key_);
    }

    outcome::result<bool> exists() const {
      return storage_->contains(key_);
    }

   private:
    std::shared_ptr<BufferStorage> storage_;
    Buffer key_;
  };

  /**
   * Map of SCALE-encoded values. Encoded keys are the tails of the storage
   * keys, so keys can be recovered while iterating.
   */
  template <typename K, typename V>
  class StorageMap {
   public:
    StorageMap(std::shared_ptr<BufferStorage> storage,
               std::shared_ptr<crypto::Hasher> hasher,
               std::string_view module,
               std::string_view item)
        : storage_{std::move(storage)},
          hasher_{std::move(hasher)},
          prefix_{storagePrefix(*hasher_, module, item)} {}

    const Buffer &prefix() const {
      return prefix_;
    }

    outcome::result<Buffer> key(const K &k) const {
      return storageMapKey(*hasher_, prefix_, k);
    }

    outcome::result<std::optional<V>> tryGet(const K &k) const {
      OUTCOME_TRY(storage_key, key(k));
      OUTCOME_TRY(raw, storage_->tryGet(storage_key));
      if (not raw) {
        return std::nullopt;
      }
      OUTCOME_TRY(value, scale::decode<V>(*raw));
      return std::optional<V>{std::move(value)};
    }

    /// @return value or DatabaseError::NOT_FOUND
    outcome::result<V> get(const K &k) const {
      OUTCOME_TRY(value, tryGet(k));
      if (not value) {
        return DatabaseError::NOT_FOUND;
      }
      return std::move(*value);
    }

    outcome::result<void> put(const K &k, const V &value) {
      OUTCOME_TRY(storage_key, key(k));
      OUTCOME_TRY(raw, scale::encode(value));
      return storage_->put(storage_key, std::move(raw));
    }

    outcome::result<void> remove(const K &k) {
      OUTCOME_TRY(storage_key, key(k));
      return storage_->remove(storage_key);
    }

    outcome::result<bool> contains(const K &k) const {
      OUTCOME_TRY(storage_key, key(k));
      return storage_->contains(storage_key);
    }

    /// Keys of all entries, ordered by their storage keys
    outcome::result<std::vector<K>> keys() const {
      constexpr size_t kHashedKeySize = common::Hash128::size();
      OUTCOME_TRY(storage_keys, storage_->keysWithPrefix(prefix_));
      std::vector<K> result;
      result.reserve(storage_keys.size());
      for (auto &storage_key : storage_keys) {
        if (storage_key.size() < prefix_.size() + kHashedKeySize) {
          return DatabaseError::CORRUPTION;
        }
        OUTCOME_TRY(k,
                    scale::decode<K>(storage_key.view(prefix_.size()
                                                      + kHashedKeySize)));
        result.emplace_back(std::move(k));
      }
      return result;
    }

   private:
    std::shared_ptr<BufferStorage> storage_;
    std::shared_ptr<crypto::Hasher> hasher_;
    Buffer prefix_;
  };

}  // namespace trestle::storage
