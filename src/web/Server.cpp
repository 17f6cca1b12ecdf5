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

#include "web/Server.hpp"

#include "util/Assert.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"
#include "web/MessageHandler.hpp"
#include "web/impl/ConnectionHandler.hpp"
#include "web/impl/HttpConnection.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace web {

namespace {

std::expected<boost::asio::ip::tcp::endpoint, std::string>
makeEndpoint(util::Config const& serverConfig)
{
    auto const ip = serverConfig.valueOr<std::string>("ip", "0.0.0.0");

    boost::system::error_code error;
    auto const address = boost::asio::ip::make_address(ip, error);
    if (error)
        return std::unexpected{fmt::format("Invalid 'ip' in server config: {}", ip)};

    auto const port = serverConfig.maybeValue<unsigned short>("port");
    if (not port.has_value())
        return std::unexpected{"Missing 'port' in server config; use --port or server.port"};

    return boost::asio::ip::tcp::endpoint{address, *port};
}

std::expected<boost::asio::ip::tcp::acceptor, std::string>
listenOn(boost::asio::io_context& context, boost::asio::ip::tcp::endpoint const& endpoint)
{
    boost::asio::ip::tcp::acceptor acceptor{context};
    boost::system::error_code error;

    acceptor.open(endpoint.protocol(), error);
    if (not error)
        acceptor.set_option(boost::asio::socket_base::reuse_address(true), error);
    if (not error)
        acceptor.bind(endpoint, error);
    if (not error)
        acceptor.listen(boost::asio::socket_base::max_listen_connections, error);

    if (error)
        return std::unexpected{fmt::format("Error creating TCP acceptor on {}: {}", endpoint.port(), error.message())};
    return acceptor;
}

}  // namespace

Server::Server(
    boost::asio::io_context& ctx,
    boost::asio::ip::tcp::endpoint endpoint,
    std::size_t maxRequestSize,
    impl::ConnectionHandler connectionHandler
)
    : ctx_{ctx}
    , connectionHandler_{std::move(connectionHandler)}
    , endpoint_{std::move(endpoint)}
    , maxRequestSize_{maxRequestSize}
{
}

void
Server::onGet(std::string const& target, MessageHandler handler)
{
    ASSERT(not running_, "Routes are fixed once the server runs");
    connectionHandler_.onGet(target, std::move(handler));
}

void
Server::onPost(std::string const& target, MessageHandler handler)
{
    ASSERT(not running_, "Routes are fixed once the server runs");
    connectionHandler_.onPost(target, std::move(handler));
}

void
Server::onFallback(MessageHandler handler)
{
    ASSERT(not running_, "Routes are fixed once the server runs");
    connectionHandler_.onFallback(std::move(handler));
}

std::optional<std::string>
Server::run()
{
    auto acceptor = listenOn(ctx_.get(), endpoint_);
    if (not acceptor.has_value())
        return std::move(acceptor).error();

    endpoint_ = acceptor->local_endpoint();
    LOG(log_.info()) << "Listening on " << endpoint_.address().to_string() << ":" << endpoint_.port();

    running_ = true;
    boost::asio::spawn(
        ctx_.get(),
        [this, acceptor = std::move(acceptor).value()](boost::asio::yield_context yield) mutable {
            acceptLoop(std::move(acceptor), yield);
        },
        boost::asio::detached
    );
    return std::nullopt;
}

boost::asio::ip::tcp::endpoint const&
Server::endpoint() const
{
    return endpoint_;
}

void
Server::acceptLoop(boost::asio::ip::tcp::acceptor acceptor, boost::asio::yield_context yield)
{
    for (;;) {
        boost::system::error_code error;
        boost::asio::ip::tcp::socket socket{boost::asio::make_strand(ctx_.get())};

        acceptor.async_accept(socket, yield[error]);
        if (error == boost::asio::error::operation_aborted)
            return;
        if (error) {
            LOG(log_.debug()) << "Accept failed: " << error.message();
            continue;
        }

        auto const executor = socket.get_executor();
        boost::asio::spawn(
            executor,
            [this, socket = std::move(socket)](boost::asio::yield_context yield) mutable {
                serve(std::move(socket), yield);
            },
            boost::asio::detached
        );
    }
}

void
Server::serve(boost::asio::ip::tcp::socket socket, boost::asio::yield_context yield)
{
    boost::system::error_code error;
    auto const peer = socket.remote_endpoint(error);
    if (error) {
        LOG(log_.info()) << "Dropping connection without a remote endpoint: " << error.message();
        return;
    }

    connectionHandler_.processConnection(
        std::make_unique<impl::HttpConnection>(std::move(socket), peer.address().to_string(), maxRequestSize_), yield
    );
}

std::expected<Server, std::string>
make_Server(util::Config const& config, boost::asio::io_context& context)
{
    auto const serverConfig = config.sectionOr("server", {});

    std::expected<boost::asio::ip::tcp::endpoint, std::string> endpoint;
    std::size_t maxRequestSize = 0;
    try {
        endpoint = makeEndpoint(serverConfig);
        maxRequestSize = serverConfig.valueOr<std::uint64_t>("max_request_size", Server::kDEFAULT_MAX_REQUEST_SIZE);
    } catch (std::exception const& e) {
        return std::unexpected{fmt::format("Invalid server configuration: {}", e.what())};
    }

    if (not endpoint.has_value())
        return std::unexpected{std::move(endpoint).error()};

    if (maxRequestSize == 0)
        return std::unexpected{"server.max_request_size must be positive"};

    return Server{context, std::move(endpoint).value(), maxRequestSize};
}

}  // namespace web
