/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/relay_engine.hpp"

#include "coro/spawn.hpp"
#include "metrics/histogram_timer.hpp"
#include "relay/backoff.hpp"
#include "relay/client_error.hpp"

namespace {
  constexpr auto kReconnects = "trestle_relay_reconnects_total";
  constexpr auto kTickErrors = "trestle_relay_rejected_ticks_total";
  constexpr auto kTickDuration = "trestle_relay_tick_duration_seconds";
}  // namespace

namespace trestle::relay {

  RelayEngine::RelayEngine(std::shared_ptr<RelayContext> context,
                           RelayTimings timings)
      : context_{std::move(context)},
        timings_{timings},
        logger_{log::createLogger("RelayEngine", "relay")} {
    BOOST_ASSERT(context_ != nullptr);

    metrics_registry_->registerCounterFamily(
        kReconnects, "Number of reconnections after connection errors");
    metrics_registry_->registerCounterFamily(
        kTickErrors, "Number of ticks failed with a non-connection error");
  }

  void RelayEngine::addTask(std::shared_ptr<RelayTask> task) {
    BOOST_ASSERT(task != nullptr);
    tasks_.emplace_back(std::move(task));
  }

  RelayEngine::ExitStatus RelayEngine::run() {
    SL_INFO(logger_, "Starting {} relay tasks", tasks_.size());
    for (auto &task : tasks_) {
      coroSpawn(context_->io().get_executor(),
                [this, task]() -> Coro<void> { co_await runTask(task); });
    }
    context_->io().run();

    if (auto &reason = context_->fatalReason()) {
      SL_CRITICAL(logger_, "Relay stopped with fatal error: {}", *reason);
      return ExitStatus::FATAL;
    }
    SL_INFO(logger_, "Relay stopped");
    return ExitStatus::STOPPED;
  }

  Coro<void> RelayEngine::runTask(std::shared_ptr<RelayTask> task) {
    auto *metric_reconnects = metrics_registry_->registerCounterMetric(
        kReconnects, {{"task", task->name()}});
    auto *metric_tick_errors = metrics_registry_->registerCounterMetric(
        kTickErrors, {{"task", task->name()}});
    metrics::HistogramTimer metric_tick_duration{
        *metrics_registry_,
        kTickDuration,
        "Duration of relay task ticks",
        metrics::exponentialBuckets(0.001, 4, 8),
        {{"task", task->name()}}};
    ExponentialBackoff backoff{timings_.backoff_initial, timings_.backoff_max};

    SL_DEBUG(logger_, "Task {} started", task->name());
    while (context_->running()) {
      auto observe_tick = metric_tick_duration.manual();
      auto ticked = co_await task->tick();
      observe_tick();
      if (not context_->running()) {
        break;
      }

      if (ticked.has_value()) {
        backoff.reset();
      } else if (isConnectionError(ticked.error())) {
        auto delay = backoff.next();
        SL_WARN(logger_,
                "Task {} lost connection: {}, reconnecting in {} ms",
                task->name(),
                ticked.error(),
                delay.count());
        metric_reconnects->inc();
        if (not co_await context_->sleep(delay)) {
          break;
        }
        if (auto reconnected = co_await task->reconnect();
            not reconnected) {
          SL_WARN(logger_,
                  "Task {} failed to reconnect: {}",
                  task->name(),
                  reconnected.error());
        }
        continue;
      } else {
        // the chain state has moved on, next tick reads it again
        SL_INFO(logger_,
                "Task {} submission is rejected: {}. Probably the work is "
                "done by another relayer",
                task->name(),
                ticked.error());
        metric_tick_errors->inc();
      }

      if (not co_await context_->sleep(timings_.tick_interval)) {
        break;
      }
    }
    SL_DEBUG(logger_, "Task {} finished", task->name());
  }

}  // namespace trestle::relay
