/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_map>
#include <variant>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace trestle::metrics {

  /**
   * Registry over the process-wide prometheus registry, so metrics of every
   * component are served by one exposer
   */
  class PrometheusRegistry : public Registry {
   public:
    static std::shared_ptr<prometheus::Registry> prometheusRegistry();

    static prometheus::Counter *internalMetric(Counter *metric);
    static prometheus::Gauge *internalMetric(Gauge *metric);
    static prometheus::Histogram *internalMetric(Histogram *metric);

    void setHandler(Handler &handler) override;

    void registerCounterFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerGaugeFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerHistogramFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    Counter *registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Gauge *registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const std::map<std::string, std::string> &labels) override;

   private:
    using AnyFamily = std::variant<prometheus::Family<prometheus::Counter> *,
                                   prometheus::Family<prometheus::Gauge> *,
                                   prometheus::Family<prometheus::Histogram> *>;

    template <typename T>
    prometheus::Family<T> *family(const std::string &name) const {
      auto it = families_.find(name);
      if (it == families_.end()) {
        return nullptr;
      }
      auto *family = std::get_if<prometheus::Family<T> *>(&it->second);
      return family != nullptr ? *family : nullptr;
    }

    std::unordered_map<std::string, AnyFamily> families_;
    std::vector<std::unique_ptr<PrometheusCounter>> counters_;
    std::vector<std::unique_ptr<PrometheusGauge>> gauges_;
    std::vector<std::unique_ptr<PrometheusHistogram>> histograms_;
  };

}  // namespace trestle::metrics
