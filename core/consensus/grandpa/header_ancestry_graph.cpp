/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/grandpa/header_ancestry_graph.hpp"

namespace trestle::consensus::grandpa {

  HeaderAncestryGraph HeaderAncestryGraph::build(
      std::vector<primitives::BlockHeader> headers,
      const crypto::Hasher &hasher) {
    HeaderAncestryGraph graph;
    primitives::calculateBlockHashes(headers, hasher);
    graph.headers_ = std::move(headers);
    for (size_t i = 0; i < graph.headers_.size(); ++i) {
      // first occurrence wins, the rest are duplicates
      graph.by_hash_.emplace(graph.headers_[i].hash(), i);
    }
    return graph;
  }

  bool HeaderAncestryGraph::isAncestor(const BlockHash &target,
                                       const BlockHash &candidate) const {
    return route(target, candidate).has_value();
  }

  std::optional<std::vector<HeaderAncestryGraph::BlockHash>>
  HeaderAncestryGraph::route(const BlockHash &target,
                             const BlockHash &candidate) const {
    std::vector<BlockHash> walked;
    auto current = candidate;
    while (current != target) {
      if (walked.size() >= by_hash_.size()) {
        return std::nullopt;
      }
      auto it = by_hash_.find(current);
      if (it == by_hash_.end()) {
        return std::nullopt;
      }
      walked.emplace_back(current);
      current = headers_[it->second].parent_hash;
    }
    return walked;
  }

  void HeaderAncestryGraph::markVisited(const std::vector<BlockHash> &route) {
    visited_.insert(route.begin(), route.end());
  }

  std::vector<size_t> HeaderAncestryGraph::unvisitedIndices() const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < headers_.size(); ++i) {
      const auto &hash = headers_[i].hash();
      auto first = by_hash_.at(hash);
      if (first != i or not visited_.contains(hash)) {
        indices.push_back(i);
      }
    }
    return indices;
  }

}  // namespace trestle::consensus::grandpa
