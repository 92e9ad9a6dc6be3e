/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <thread>

#include "log/logger.hpp"
#include "metrics/exposer.hpp"
#include "metrics/session.hpp"

namespace trestle::metrics {

  class ExposerImpl : public Exposer,
                      public std::enable_shared_from_this<ExposerImpl> {
    log::Logger logger_;

   public:
    ExposerImpl(Exposer::Configuration exposer_config,
                Session::Configuration session_config);

    ~ExposerImpl() override;

    bool prepare() override;
    bool start() override;
    void stop() override;

    /// port the acceptor is bound to, useful when configured with port 0
    uint16_t port() const;

   private:
    void acceptOnce();

    std::shared_ptr<Context> context_;
    const Configuration config_;
    const Session::Configuration session_config_;

    std::unique_ptr<Acceptor> acceptor_;

    std::shared_ptr<Session> new_session_;

    std::unique_ptr<std::thread> thread_;
  };

}  // namespace trestle::metrics
