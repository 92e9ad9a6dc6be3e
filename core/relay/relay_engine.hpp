/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "relay/relay_config.hpp"
#include "relay/relay_context.hpp"
#include "relay/relay_task.hpp"

namespace trestle::relay {

  /**
   * Runs every relay task as a coroutine on the io_context of the context.
   * A task ticks sequentially: poll, decide, submit, wait for the next tick.
   * Connection errors are retried after a reconnect with exponential backoff.
   * Rejected submissions are logged and the task moves on, the chain state
   * read at the next tick decides what to submit.
   */
  class RelayEngine {
   public:
    enum class ExitStatus : uint8_t {
      /// Shutdown was requested
      STOPPED,
      /// A task raised the fatal outcome
      FATAL,
    };

    RelayEngine(std::shared_ptr<RelayContext> context, RelayTimings timings);

    void addTask(std::shared_ptr<RelayTask> task);

    /**
     * Blocks until every task is finished and the io_context runs out of work
     */
    ExitStatus run();

   private:
    Coro<void> runTask(std::shared_ptr<RelayTask> task);

    std::shared_ptr<RelayContext> context_;
    RelayTimings timings_;
    std::vector<std::shared_ptr<RelayTask>> tasks_;

    metrics::RegistryPtr metrics_registry_ = metrics::createRegistry();

    log::Logger logger_;
  };

}  // namespace trestle::relay
