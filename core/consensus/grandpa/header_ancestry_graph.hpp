/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "crypto/hasher.hpp"
#include "primitives/block_header.hpp"

namespace trestle::consensus::grandpa {

  /**
   * Lookup of headers supplied as a proof of ancestry (votes ancestries of a
   * justification), answers whether one block descends from another.
   * Walks are bounded by the number of headers, an unknown hash simply ends
   * the walk.
   */
  class HeaderAncestryGraph {
   public:
    using BlockHash = primitives::BlockHash;

    /**
     * Indexes the headers by their hashes. Headers repeating an already
     * indexed hash are remembered as duplicates.
     */
    static HeaderAncestryGraph build(
        std::vector<primitives::BlockHeader> headers,
        const crypto::Hasher &hasher);

    /**
     * True if walking parent links from `candidate` reaches `target`
     * (equal hashes included)
     */
    bool isAncestor(const BlockHash &target, const BlockHash &candidate) const;

    /**
     * Hashes of the headers walked from `candidate` until `target` is
     * reached, `target` itself excluded. Empty when they are equal,
     * nullopt when `target` is unreachable.
     */
    std::optional<std::vector<BlockHash>> route(
        const BlockHash &target, const BlockHash &candidate) const;

    /// Remembers the headers of the route as used
    void markVisited(const std::vector<BlockHash> &route);

    /// Positions of the headers, which were never visited or duplicate
    std::vector<size_t> unvisitedIndices() const;

    size_t size() const {
      return headers_.size();
    }

   private:
    std::vector<primitives::BlockHeader> headers_;
    std::unordered_map<BlockHash, size_t> by_hash_;
    std::unordered_set<BlockHash> visited_;
  };

}  // namespace trestle::consensus::grandpa
