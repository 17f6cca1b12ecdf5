//------------------------------------------------------------------------------
/*
    This file is part of tronbridge.
    Copyright (c) 2024, the tronbridge developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"
#include "web/MessageHandler.hpp"
#include "web/impl/ConnectionHandler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace web {

/**
 * @brief Accepts plain HTTP connections and serves each one on its own strand.
 *
 * Handlers are registered before run(); registering afterwards is a programming error.
 */
class Server {
    util::Logger log_{"WebServer"};
    std::reference_wrapper<boost::asio::io_context> ctx_;

    impl::ConnectionHandler connectionHandler_;
    boost::asio::ip::tcp::endpoint endpoint_;
    std::size_t maxRequestSize_;

    bool running_{false};

public:
    static constexpr std::size_t kDEFAULT_MAX_REQUEST_SIZE = 1024 * 1024;

    /**
     * @param ctx Context the acceptor and the connections run on
     * @param endpoint Where to listen; port 0 picks an ephemeral port
     * @param maxRequestSize Largest request body accepted, larger ones are answered with 413
     * @param connectionHandler Dispatches requests to handlers
     */
    Server(
        boost::asio::io_context& ctx,
        boost::asio::ip::tcp::endpoint endpoint,
        std::size_t maxRequestSize,
        impl::ConnectionHandler connectionHandler = {}
    );

    Server(Server const&) = delete;
    Server(Server&&) = default;

    void
    onGet(std::string const& target, MessageHandler handler);

    void
    onPost(std::string const& target, MessageHandler handler);

    /** Serves whatever no GET or POST route matches. */
    void
    onFallback(MessageHandler handler);

    /**
     * @brief Bind, listen and start accepting in the background.
     *
     * @return An error message if the endpoint could not be bound
     */
    std::optional<std::string>
    run();

    /** The bound endpoint once run() succeeded, the requested one before. */
    boost::asio::ip::tcp::endpoint const&
    endpoint() const;

private:
    void
    acceptLoop(boost::asio::ip::tcp::acceptor acceptor, boost::asio::yield_context yield);

    void
    serve(boost::asio::ip::tcp::socket socket, boost::asio::yield_context yield);
};

/**
 * @brief Build a Server from the `server` section: `ip` (default 0.0.0.0), `port` (required) and
 * `max_request_size` (bytes, positive).
 *
 * @return The server, not yet running, or why the section is unusable
 */
std::expected<Server, std::string>
make_Server(util::Config const& config, boost::asio::io_context& context);

}  // namespace web
