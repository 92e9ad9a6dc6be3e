/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <boost/asio/strand.hpp>
#include <boost/beast.hpp>

#include "log/logger.hpp"
#include "metrics/session.hpp"

namespace trestle::metrics {

  class SessionImpl : public Session,
                      public std::enable_shared_from_this<SessionImpl> {
    using Parser = boost::beast::http::request_parser<Body>;
    using HttpError = boost::beast::http::error;

   public:
    SessionImpl(Context &context, Configuration config);
    ~SessionImpl() override = default;

    Socket &socket() override {
      return stream_.socket();
    }

    void start() override;

    /**
     * @brief sends response wrapped by http message
     * @param response message to send
     */
    void respond(Response response) override;

   private:
    void stop();

    void asyncRead();

    void asyncWrite(Response message);

    void onRead(boost::system::error_code ec, std::size_t size);

    void onWrite(bool close, boost::system::error_code ec, std::size_t);

    void reportError(boost::system::error_code ec, std::string_view message);

    /// Strand to ensure the connection's handlers are not called concurrently.
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;

    Configuration config_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::shared_ptr<void> res_;

    std::unique_ptr<Parser> parser_;
    log::Logger logger_;
  };

}  // namespace trestle::metrics
