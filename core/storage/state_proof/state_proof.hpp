/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "crypto/hasher.hpp"
#include "scale/trestle_scale.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace trestle::storage {

  enum class StateProofError : uint8_t {
    ROOT_MISMATCH = 1,
    DUPLICATE_ENTRY,
    STORAGE_VALUE_UNAVAILABLE,
    UNUSED_ENTRIES_IN_THE_PROOF,
  };

  /**
   * Proven key-value pair with the authentication path of its leaf
   */
  struct StateProofEntry {
    Buffer key;
    Buffer value;
    uint64_t leaf_index = 0;
    std::vector<common::Hash256> path;

    bool operator==(const StateProofEntry &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const StateProofEntry &v) {
    return s << v.key << v.value << v.leaf_index << v.path;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, StateProofEntry &v) {
    return s >> v.key >> v.value >> v.leaf_index >> v.path;
  }

  /**
   * Proof of a subset of the state entries against the state root.
   * The state root is the root of a binary Merkle tree over the leaves
   * blake2b_256(0x00 ++ scale(key, value)) in ascending key order, inner
   * nodes are blake2b_256(0x01 ++ left ++ right) and the last node of an
   * odd level is promoted as is.
   */
  struct StateProof {
    uint64_t leaves_count = 0;
    std::vector<StateProofEntry> entries;

    bool operator==(const StateProof &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const StateProof &v) {
    return s << v.leaves_count << v.entries;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, StateProof &v) {
    return s >> v.leaves_count >> v.entries;
  }

  /**
   * Root of the whole storage
   */
  outcome::result<common::Hash256> stateRoot(const InMemoryStorage &storage,
                                             const crypto::Hasher &hasher);

  /**
   * Proof of the given keys, keys missing in the storage are not included
   */
  outcome::result<StateProof> prepareStateProof(const InMemoryStorage &storage,
                                                const std::vector<Buffer> &keys,
                                                const crypto::Hasher &hasher);

  /**
   * Read access to a proof, checked against a trusted state root.
   * Tracks which entries were read, so a caller can reject proofs carrying
   * more than was needed.
   */
  class StateProofChecker {
   public:
    /**
     * Checks every entry of the proof against the root
     * @return checker or ROOT_MISMATCH or DUPLICATE_ENTRY
     */
    static outcome::result<StateProofChecker> create(
        const crypto::Hasher &hasher,
        const common::Hash256 &root,
        const StateProof &proof);

    /**
     * Value of the key or nullopt if the proof does not carry it
     */
    std::optional<BufferView> readValue(const BufferView &key);

    template <typename T>
    outcome::result<std::optional<T>> readAndDecodeValue(
        const BufferView &key) {
      auto raw = readValue(key);
      if (not raw) {
        return std::nullopt;
      }
      OUTCOME_TRY(value, scale::decode<T>(*raw));
      return std::optional<T>{std::move(value)};
    }

    template <typename T>
    outcome::result<T> readAndDecodeMandatoryValue(const BufferView &key) {
      OUTCOME_TRY(value, readAndDecodeValue<T>(key));
      if (not value) {
        return StateProofError::STORAGE_VALUE_UNAVAILABLE;
      }
      return std::move(*value);
    }

    /**
     * @return UNUSED_ENTRIES_IN_THE_PROOF if some entry was never read
     */
    outcome::result<void> ensureNoUnusedEntries() const;

   private:
    struct Entry {
      Buffer value;
      bool used = false;
    };

    StateProofChecker() = default;

    std::map<Buffer, Entry> entries_;
  };

}  // namespace trestle::storage

OUTCOME_HPP_DECLARE_ERROR(trestle::storage, StateProofError);
