/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include "metrics/handler.hpp"

namespace trestle::metrics {

  RegistryPtr createRegistry() {
    return std::make_unique<PrometheusRegistry>();
  }

  std::shared_ptr<prometheus::Registry>
  PrometheusRegistry::prometheusRegistry() {
    static auto registry = std::make_shared<prometheus::Registry>();
    return registry;
  }

  prometheus::Counter *PrometheusRegistry::internalMetric(Counter *metric) {
    return &static_cast<PrometheusCounter *>(metric)->m_;
  }

  prometheus::Gauge *PrometheusRegistry::internalMetric(Gauge *metric) {
    return &static_cast<PrometheusGauge *>(metric)->m_;
  }

  prometheus::Histogram *PrometheusRegistry::internalMetric(
      Histogram *metric) {
    return &static_cast<PrometheusHistogram *>(metric)->m_;
  }

  void PrometheusRegistry::setHandler(Handler &handler) {
    handler.registerCollectable(*this);
  }

  void PrometheusRegistry::registerCounterFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    families_.emplace(name,
                      &prometheus::BuildCounter()
                           .Name(name)
                           .Help(help)
                           .Labels(labels)
                           .Register(*prometheusRegistry()));
  }

  void PrometheusRegistry::registerGaugeFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    families_.emplace(name,
                      &prometheus::BuildGauge()
                           .Name(name)
                           .Help(help)
                           .Labels(labels)
                           .Register(*prometheusRegistry()));
  }

  void PrometheusRegistry::registerHistogramFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    families_.emplace(name,
                      &prometheus::BuildHistogram()
                           .Name(name)
                           .Help(help)
                           .Labels(labels)
                           .Register(*prometheusRegistry()));
  }

  Counter *PrometheusRegistry::registerCounterMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    auto *counters = family<prometheus::Counter>(name);
    if (counters == nullptr) {
      return nullptr;
    }
    return counters_
        .emplace_back(
            std::make_unique<PrometheusCounter>(counters->Add(labels)))
        .get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    auto *gauges = family<prometheus::Gauge>(name);
    if (gauges == nullptr) {
      return nullptr;
    }
    return gauges_
        .emplace_back(std::make_unique<PrometheusGauge>(gauges->Add(labels)))
        .get();
  }

  Histogram *PrometheusRegistry::registerHistogramMetric(
      const std::string &name,
      const std::vector<double> &bucket_boundaries,
      const std::map<std::string, std::string> &labels) {
    auto *histograms = family<prometheus::Histogram>(name);
    if (histograms == nullptr) {
      return nullptr;
    }
    return histograms_
        .emplace_back(std::make_unique<PrometheusHistogram>(
            histograms->Add(labels, bucket_boundaries)))
        .get();
  }

}  // namespace trestle::metrics
