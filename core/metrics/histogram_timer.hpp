/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"
#include "metrics/registry.hpp"

#include <chrono>
#include <optional>

#include <libp2p/common/final_action.hpp>

namespace trestle::metrics {
  inline std::vector<double> exponentialBuckets(double start,
                                                double factor,
                                                size_t count) {
    std::vector<double> buckets;
    for (auto bucket = start; buckets.size() < count; bucket *= factor) {
      buckets.emplace_back(bucket);
    }
    return buckets;
  }

  /**
   * Observes durations in seconds
   */
  struct HistogramTimer {
    using Clock = std::chrono::steady_clock;
    using Time = Clock::time_point;

    HistogramTimer(Registry &registry,
                   const std::string &name,
                   const std::string &help,
                   std::vector<double> buckets,
                   const std::map<std::string, std::string> &labels = {}) {
      registry.registerHistogramFamily(name, help);
      metric_ = registry.registerHistogramMetric(name, buckets, labels);
    }

    auto observe(const Time &begin) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
          Clock::now() - begin);
      metric_->observe(ms.count() / 1000.0);
      return ms;
    }

    auto manual() {
      return [this, begin = Clock::now()] { return observe(begin); };
    }

    auto timer() {
      return std::make_optional(::libp2p::common::MovableFinalAction(manual()));
    }

    metrics::Histogram *metric_;
  };
}  // namespace trestle::metrics
