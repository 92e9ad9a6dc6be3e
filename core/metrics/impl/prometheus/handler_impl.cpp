/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/handler_impl.hpp"

#include <algorithm>

#include <prometheus/text_serializer.h>

#include "metrics/impl/prometheus/registry_impl.hpp"

using namespace prometheus;

namespace {
  std::vector<MetricFamily> collectMetrics(
      const std::vector<std::weak_ptr<Collectable>> &collectables) {
    auto collected_metrics = std::vector<MetricFamily>{};

    for (auto &&wcollectable : collectables) {
      auto collectable = wcollectable.lock();
      if (!collectable) {
        continue;
      }

      auto &&metrics = collectable->Collect();
      collected_metrics.insert(collected_metrics.end(),
                               std::make_move_iterator(metrics.begin()),
                               std::make_move_iterator(metrics.end()));
    }

    return collected_metrics;
  }
}  // namespace

namespace trestle::metrics {

  PrometheusHandler::PrometheusHandler(prometheus::Registry &registry)
      : bytes_transferred_family_(
          BuildCounter()
              .Name("exposer_transferred_bytes_total")
              .Help("Transferred bytes to metrics services")
              .Register(registry)),
        bytes_transferred_(bytes_transferred_family_.Add({})),
        num_scrapes_family_(BuildCounter()
                                .Name("exposer_scrapes_total")
                                .Help("Number of times metrics were scraped")
                                .Register(registry)),
        num_scrapes_(num_scrapes_family_.Add({})),
        request_latencies_family_(
            BuildSummary()
                .Name("exposer_request_latencies")
                .Help("Latencies of serving scrape requests, in microseconds")
                .Register(registry)),
        request_latencies_(request_latencies_family_.Add(
            {}, Summary::Quantiles{{0.5, 0.05}, {0.9, 0.01}, {0.99, 0.001}})),
        logger_{log::createLogger("PrometheusHandler", "metrics")} {}

  void PrometheusHandler::registerCollectable(Registry &registry) {
    if (dynamic_cast<PrometheusRegistry *>(&registry) == nullptr) {
      SL_WARN(logger_, "Only prometheus registries can be collected");
      return;
    }
    registerCollectable(PrometheusRegistry::prometheusRegistry());
  }

  void PrometheusHandler::onSessionRequest(Session::Request request,
                                           std::shared_ptr<Session> session) {
    auto start_time_of_request = std::chrono::steady_clock::now();

    std::vector<MetricFamily> metrics;

    {
      std::lock_guard<std::mutex> lock{collectables_mutex_};
      metrics = collectMetrics(collectables_);
    }

    const TextSerializer serializer;

    auto size = writeResponse(session, request, serializer.Serialize(metrics));

    auto stop_time_of_request = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        stop_time_of_request - start_time_of_request);
    request_latencies_.Observe(duration.count());

    bytes_transferred_.Increment(size);
    num_scrapes_.Increment();
  }

  std::size_t PrometheusHandler::writeResponse(
      std::shared_ptr<Session> session,
      const Session::Request &request,
      const std::string &body) {
    Session::Response res{boost::beast::http::status::ok, request.version()};
    res.set(boost::beast::http::field::content_type,
            "text/plain; charset=utf-8");
    res.set(boost::beast::http::field::content_length,
            std::to_string(body.size()));
    res.keep_alive(request.keep_alive());
    res.body() = body;
    res.prepare_payload();
    session->respond(std::move(res));
    return body.size();
  }

  void PrometheusHandler::registerCollectable(
      const std::weak_ptr<Collectable> &collectable) {
    std::lock_guard<std::mutex> lock{collectables_mutex_};
    cleanupStalePointers(collectables_);
    auto locked = collectable.lock();
    auto already_registered =
        std::any_of(collectables_.begin(),
                    collectables_.end(),
                    [&](const std::weak_ptr<Collectable> &candidate) {
                      return candidate.lock() == locked;
                    });
    if (not already_registered) {
      collectables_.push_back(collectable);
    }
  }

  void PrometheusHandler::cleanupStalePointers(
      std::vector<std::weak_ptr<Collectable>> &collectables) {
    collectables.erase(
        std::remove_if(std::begin(collectables),
                       std::end(collectables),
                       [](const std::weak_ptr<Collectable> &candidate) {
                         return candidate.expired();
                       }),
        std::end(collectables));
  }

}  // namespace trestle::metrics
