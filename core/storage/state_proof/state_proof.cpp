/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/state_proof/state_proof.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(trestle::storage, StateProofError, e) {
  using E = trestle::storage::StateProofError;
  switch (e) {
    case E::ROOT_MISMATCH:
      return "state proof does not match the state root";
    case E::DUPLICATE_ENTRY:
      return "state proof contains the same key twice";
    case E::STORAGE_VALUE_UNAVAILABLE:
      return "required value is missing in the state proof";
    case E::UNUSED_ENTRIES_IN_THE_PROOF:
      return "state proof contains entries which were not read";
  }
  return "unknown error";
}

namespace trestle::storage {
  using common::Hash256;

  namespace {
    constexpr uint8_t kLeafTag = 0;
    constexpr uint8_t kNodeTag = 1;

    outcome::result<Hash256> leafHash(const crypto::Hasher &hasher,
                                      const BufferView &key,
                                      const BufferView &value) {
      OUTCOME_TRY(encoded, scale::encode(Buffer{key}, Buffer{value}));
      Buffer leaf;
      leaf.putUint8(kLeafTag).put(encoded);
      return hasher.blake2b_256(leaf);
    }

    Hash256 nodeHash(const crypto::Hasher &hasher,
                     const Hash256 &left,
                     const Hash256 &right) {
      Buffer node;
      node.putUint8(kNodeTag).put(left).put(right);
      return hasher.blake2b_256(node);
    }

    // levels of the tree, from the leaves up to the root
    std::vector<std::vector<Hash256>> buildLevels(
        const crypto::Hasher &hasher, std::vector<Hash256> leaves) {
      std::vector<std::vector<Hash256>> levels;
      levels.emplace_back(std::move(leaves));
      while (levels.back().size() > 1) {
        const auto &level = levels.back();
        std::vector<Hash256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
          if (i + 1 < level.size()) {
            next.emplace_back(nodeHash(hasher, level[i], level[i + 1]));
          } else {
            next.emplace_back(level[i]);
          }
        }
        levels.emplace_back(std::move(next));
      }
      return levels;
    }

    outcome::result<std::vector<Hash256>> storageLeaves(
        const InMemoryStorage &storage, const crypto::Hasher &hasher) {
      std::vector<Hash256> leaves;
      leaves.reserve(storage.entries().size());
      for (const auto &[key, value] : storage.entries()) {
        OUTCOME_TRY(leaf, leafHash(hasher, key, value));
        leaves.emplace_back(leaf);
      }
      return leaves;
    }

    std::optional<Hash256> rootFromPath(const crypto::Hasher &hasher,
                                        Hash256 hash,
                                        uint64_t index,
                                        uint64_t count,
                                        const std::vector<Hash256> &path) {
      size_t used = 0;
      while (count > 1) {
        if (index % 2 == 1) {
          if (used == path.size()) {
            return std::nullopt;
          }
          hash = nodeHash(hasher, path[used++], hash);
        } else if (index + 1 < count) {
          if (used == path.size()) {
            return std::nullopt;
          }
          hash = nodeHash(hasher, hash, path[used++]);
        }
        index /= 2;
        count = (count + 1) / 2;
      }
      if (used != path.size()) {
        return std::nullopt;
      }
      return hash;
    }
  }  // namespace

  outcome::result<Hash256> stateRoot(const InMemoryStorage &storage,
                                     const crypto::Hasher &hasher) {
    OUTCOME_TRY(leaves, storageLeaves(storage, hasher));
    if (leaves.empty()) {
      return hasher.blake2b_256(BufferView{});
    }
    return buildLevels(hasher, std::move(leaves)).back().front();
  }

  outcome::result<StateProof> prepareStateProof(const InMemoryStorage &storage,
                                                const std::vector<Buffer> &keys,
                                                const crypto::Hasher &hasher) {
    OUTCOME_TRY(leaves, storageLeaves(storage, hasher));
    StateProof proof{.leaves_count = leaves.size(), .entries = {}};
    auto levels = buildLevels(hasher, std::move(leaves));

    std::vector<Buffer> sorted_keys{keys};
    std::sort(sorted_keys.begin(), sorted_keys.end());
    sorted_keys.erase(std::unique(sorted_keys.begin(), sorted_keys.end()),
                      sorted_keys.end());

    const auto &entries = storage.entries();
    for (const auto &key : sorted_keys) {
      auto it = entries.find(key);
      if (it == entries.end()) {
        continue;
      }
      StateProofEntry entry{
          .key = key,
          .value = it->second,
          .leaf_index =
              static_cast<uint64_t>(std::distance(entries.begin(), it)),
          .path = {},
      };
      auto index = entry.leaf_index;
      for (size_t level = 0; level + 1 < levels.size(); ++level) {
        const auto &nodes = levels[level];
        if (index % 2 == 1) {
          entry.path.emplace_back(nodes[index - 1]);
        } else if (index + 1 < nodes.size()) {
          entry.path.emplace_back(nodes[index + 1]);
        }
        index /= 2;
      }
      proof.entries.emplace_back(std::move(entry));
    }
    return proof;
  }

  outcome::result<StateProofChecker> StateProofChecker::create(
      const crypto::Hasher &hasher,
      const Hash256 &root,
      const StateProof &proof) {
    StateProofChecker checker;
    for (const auto &entry : proof.entries) {
      if (entry.leaf_index >= proof.leaves_count) {
        return StateProofError::ROOT_MISMATCH;
      }
      OUTCOME_TRY(leaf, leafHash(hasher, entry.key, entry.value));
      auto computed = rootFromPath(
          hasher, leaf, entry.leaf_index, proof.leaves_count, entry.path);
      if (computed != root) {
        return StateProofError::ROOT_MISMATCH;
      }
      auto [_, inserted] =
          checker.entries_.emplace(entry.key, Entry{.value = entry.value});
      if (not inserted) {
        return StateProofError::DUPLICATE_ENTRY;
      }
    }
    return checker;
  }

  std::optional<BufferView> StateProofChecker::readValue(
      const BufferView &key) {
    auto it = entries_.find(Buffer{key});
    if (it == entries_.end()) {
      return std::nullopt;
    }
    it->second.used = true;
    return BufferView{it->second.value};
  }

  outcome::result<void> StateProofChecker::ensureNoUnusedEntries() const {
    auto unused = std::any_of(entries_.begin(),
                              entries_.end(),
                              [](const auto &entry) {
                                return not entry.second.used;
                              });
    if (unused) {
      return StateProofError::UNUSED_ENTRIES_IN_THE_PROOF;
    }
    return outcome::success();
  }

}  // namespace trestle::storage
