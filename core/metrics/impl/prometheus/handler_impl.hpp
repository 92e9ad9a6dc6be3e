/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <prometheus/collectable.h>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>
#include <prometheus/summary.h>

#include "log/logger.hpp"
#include "metrics/handler.hpp"

namespace trestle::metrics {

  /**
   * Serves metrics of the registered registries in the prometheus text
   * format
   */
  class PrometheusHandler : public Handler {
   public:
    explicit PrometheusHandler(prometheus::Registry &registry);
    ~PrometheusHandler() override = default;

    void registerCollectable(Registry &registry) override;

    void onSessionRequest(Session::Request request,
                          std::shared_ptr<Session> session) override;

   private:
    void registerCollectable(
        const std::weak_ptr<prometheus::Collectable> &collectable);
    static void cleanupStalePointers(
        std::vector<std::weak_ptr<prometheus::Collectable>> &collectables);
    std::size_t writeResponse(std::shared_ptr<Session> session,
                              const Session::Request &request,
                              const std::string &body);

    std::mutex collectables_mutex_;
    std::vector<std::weak_ptr<prometheus::Collectable>> collectables_;
    prometheus::Family<prometheus::Counter> &bytes_transferred_family_;
    prometheus::Counter &bytes_transferred_;
    prometheus::Family<prometheus::Counter> &num_scrapes_family_;
    prometheus::Counter &num_scrapes_;
    prometheus::Family<prometheus::Summary> &request_latencies_family_;
    prometheus::Summary &request_latencies_;

    log::Logger logger_;
  };

}  // namespace trestle::metrics
