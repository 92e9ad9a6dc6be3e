/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/exposer_impl.hpp"

#include <soralog/util.hpp>

#include "metrics/impl/session_impl.hpp"

namespace trestle::metrics {
  ExposerImpl::ExposerImpl(Exposer::Configuration exposer_config,
                           Session::Configuration session_config)
      : logger_{log::createLogger("OpenMetrics", "metrics")},
        context_{std::make_shared<Context>()},
        config_{std::move(exposer_config)},
        session_config_{session_config} {}

  ExposerImpl::~ExposerImpl() {
    stop();
  }

  bool ExposerImpl::prepare() {
    boost::system::error_code ec;
    acceptor_ = std::make_unique<Acceptor>(*context_);
    acceptor_->open(config_.endpoint.protocol(), ec);
    if (not ec) {
      acceptor_->set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (not ec) {
      acceptor_->bind(config_.endpoint, ec);
    }
    if (not ec) {
      acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      SL_CRITICAL(logger_,
                  "Failed to prepare a listener on {}:{}: {}",
                  config_.endpoint.address().to_string(),
                  config_.endpoint.port(),
                  ec.message());
      return false;
    }
    return true;
  }

  bool ExposerImpl::start() {
    BOOST_ASSERT(acceptor_);

    if (!acceptor_->is_open()) {
      SL_ERROR(logger_, "Trying to start on non opened acceptor");
      return false;
    }

    SL_INFO(logger_,
            "Listening for new connections on {}:{}",
            config_.endpoint.address().to_string(),
            port());
    acceptOnce();

    thread_ = std::make_unique<std::thread>([context = context_] {
      soralog::util::setThreadName("metric-exposer");
      context->run();
    });

    return true;
  }

  void ExposerImpl::stop() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
    context_->stop();
    if (thread_ and thread_->joinable()) {
      thread_->join();
    }
  }

  uint16_t ExposerImpl::port() const {
    if (not acceptor_) {
      return config_.endpoint.port();
    }
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? config_.endpoint.port() : endpoint.port();
  }

  void ExposerImpl::acceptOnce() {
    new_session_ = std::make_shared<SessionImpl>(*context_, session_config_);
    new_session_->connectOnRequest(
        [handler = handler_](Session::Request request,
                             std::shared_ptr<Session> session) {
          handler->onSessionRequest(std::move(request), std::move(session));
        });

    auto on_accept = [wp = weak_from_this()](boost::system::error_code ec) {
      if (auto self = wp.lock()) {
        if (not ec) {
          self->new_session_->start();
        }

        if (self->acceptor_->is_open()) {
          // continue to accept until acceptor is ready
          self->acceptOnce();
        }
      }
    };

    acceptor_->async_accept(new_session_->socket(), std::move(on_accept));
  }
}  // namespace trestle::metrics
