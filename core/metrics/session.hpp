/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace trestle::metrics {

  /**
   * @brief session interface for OpenMetrics service
   */
  class Session {
   public:
    using Body = boost::beast::http::string_body;
    using Request = boost::beast::http::request<Body>;
    using Response = boost::beast::http::response<Body>;
    using Context = boost::asio::io_context;
    using Socket = boost::asio::ip::tcp::socket;
    using Duration = boost::asio::steady_timer::duration;

   private:
    using OnRequestSignature = void(Request, std::shared_ptr<Session> session);
    std::function<OnRequestSignature> on_request_;  ///< `on request` callback

   public:
    struct Configuration {
      static constexpr size_t kDefaultRequestSize = 10000u;
      static constexpr Duration kDefaultTimeout = std::chrono::seconds(30);

      size_t max_request_size{kDefaultRequestSize};
      Duration operation_timeout{kDefaultTimeout};
    };

    virtual ~Session() = default;

    virtual void start() = 0;

    virtual Socket &socket() = 0;

    /**
     * @brief connects `on request` callback
     */
    void connectOnRequest(std::function<OnRequestSignature> callback) {
      on_request_ = std::move(callback);
    }

    /**
     * @brief process request message
     */
    void processRequest(Request request, std::shared_ptr<Session> session) {
      on_request_(std::move(request), std::move(session));
    }

    /**
     * @brief send response message
     */
    virtual void respond(Response message) = 0;
  };

}  // namespace trestle::metrics
