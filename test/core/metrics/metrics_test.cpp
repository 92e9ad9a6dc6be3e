/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/metrics.hpp"

#include <gtest/gtest.h>

#include "metrics/histogram_timer.hpp"
#include "metrics/impl/prometheus/registry_impl.hpp"

using trestle::metrics::Counter;
using trestle::metrics::Gauge;
using trestle::metrics::PrometheusRegistry;
using trestle::metrics::RegistryPtr;

template <typename T>
prometheus::ClientMetric getMetric(T *metric) {
  return PrometheusRegistry::internalMetric(metric)->Collect();
}

// all tests share the same static prometheus::Registry, so names differ

class MetricsTest : public ::testing::Test {
 public:
  void SetUp() override {
    registry_ = trestle::metrics::createRegistry();
  }

  Counter *createCounter(const std::string &name,
                         const std::map<std::string, std::string> &labels =
                             {}) {
    registry_->registerCounterFamily(name);
    return registry_->registerCounterMetric(name, labels);
  }

  Gauge *createGauge(const std::string &name) {
    registry_->registerGaugeFamily(name);
    return registry_->registerGaugeMetric(name);
  }

  RegistryPtr registry_;
};

/**
 * @given a fresh counter
 * @when incrementing it by one and by value
 * @then the value is accumulated
 */
TEST_F(MetricsTest, CounterInc) {
  auto counter = createCounter("counter1");
  EXPECT_DOUBLE_EQ(getMetric(counter).counter.value, 0.0);
  counter->inc();
  counter->inc(4.0);
  EXPECT_DOUBLE_EQ(getMetric(counter).counter.value, 5.0);
}

/**
 * @given a counter
 * @when incrementing it by a negative value
 * @then the value is not decreased
 */
TEST_F(MetricsTest, CounterIgnoresNegative) {
  auto counter = createCounter("counter2");
  counter->inc(5.0);
  counter->inc(-5.0);
  EXPECT_DOUBLE_EQ(getMetric(counter).counter.value, 5.0);
}

/**
 * @given one counter family with metrics of 2 tasks
 * @when incrementing one of them
 * @then the other one is intact
 */
TEST_F(MetricsTest, LabeledCounters) {
  auto first = createCounter("counter3", {{"task", "first"}});
  auto second = registry_->registerCounterMetric("counter3",
                                                 {{"task", "second"}});
  first->inc();
  EXPECT_DOUBLE_EQ(getMetric(first).counter.value, 1.0);
  EXPECT_DOUBLE_EQ(getMetric(second).counter.value, 0.0);
}

/**
 * @given an unregistered family
 * @when registering a metric of it
 * @then no metric is created
 */
TEST_F(MetricsTest, UnknownFamily) {
  EXPECT_EQ(registry_->registerGaugeMetric("no_such_gauge"), nullptr);
}

/**
 * @given a gauge
 * @when applying a sequence of operations
 * @then the value follows them
 */
TEST_F(MetricsTest, Gauge) {
  auto gauge = createGauge("gauge1");
  gauge->set(5.0);
  gauge->dec();
  gauge->inc(3.0);
  gauge->dec(-1.0);
  EXPECT_DOUBLE_EQ(getMetric(gauge).gauge.value, 8.0);
}

/**
 * @given a histogram timer
 * @when a duration is observed
 * @then one sample lands in the histogram
 */
TEST_F(MetricsTest, HistogramTimer) {
  trestle::metrics::HistogramTimer timer{
      *registry_,
      "histogram1",
      "durations",
      trestle::metrics::exponentialBuckets(0.001, 4, 8),
      {{"task", "test"}}};
  ASSERT_NE(timer.metric_, nullptr);
  timer.manual()();
  auto histogram = getMetric(timer.metric_).histogram;
  EXPECT_EQ(histogram.sample_count, 1);
  EXPECT_EQ(histogram.bucket.size(), 9);
}

/**
 * @given exponential buckets parameters
 * @when building the buckets
 * @then each bucket is the previous one times the factor
 */
TEST(ExponentialBucketsTest, Build) {
  EXPECT_EQ(trestle::metrics::exponentialBuckets(1, 2, 4),
            (std::vector<double>{1, 2, 4, 8}));
}
