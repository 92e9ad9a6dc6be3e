/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/runtime_version_guard.hpp"

namespace trestle::relay {

  RuntimeVersionGuard::RuntimeVersionGuard(
      std::string name,
      std::shared_ptr<RuntimeVersionClient> client,
      std::shared_ptr<RelayContext> context,
      RuntimeGuardParams params)
      : name_{std::move(name)},
        client_{std::move(client)},
        context_{std::move(context)},
        params_{params},
        logger_{log::createLogger("RuntimeVersionGuard", "relay_guard")} {
    BOOST_ASSERT(client_ != nullptr);
    BOOST_ASSERT(context_ != nullptr);
  }

  CoroOutcome<void> RuntimeVersionGuard::reconnect() {
    return client_->reconnect();
  }

  CoroOutcome<void> RuntimeVersionGuard::tick() {
    auto version = CO_TRY(co_await client_->runtimeVersion());

    if (params_.expected_spec_version) {
      if (version.spec_version != *params_.expected_spec_version) {
        context_->raiseFatal(fmt::format(
            "[{}] Target runtime is {}, the relay is built for spec version {}",
            name_,
            version,
            *params_.expected_spec_version));
      }
      co_return outcome::success();
    }

    if (not first_seen_) {
      SL_INFO(logger_, "[{}] Target runtime is {}", name_, version);
      first_seen_ = std::move(version);
    } else if (version != *first_seen_) {
      context_->raiseFatal(
          fmt::format("[{}] Target runtime changed from {} to {}",
                      name_,
                      *first_seen_,
                      version));
    }
    co_return outcome::success();
  }

}  // namespace trestle::relay
