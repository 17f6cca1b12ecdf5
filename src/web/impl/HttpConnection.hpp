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

#include "web/Connection.hpp"
#include "web/Error.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>

namespace web::impl {

/**
 * @brief A plain TCP connection speaking HTTP/1.x. Every read and write is bounded by the same timeout.
 */
class HttpConnection : public Connection {
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::size_t bodyLimit_;
    std::chrono::steady_clock::duration timeout_;

public:
    static constexpr std::chrono::steady_clock::duration kDEFAULT_TIMEOUT = std::chrono::seconds{30};

    HttpConnection(
        boost::asio::ip::tcp::socket socket,
        std::string clientIp,
        std::size_t bodyLimit,
        std::chrono::steady_clock::duration timeout = kDEFAULT_TIMEOUT
    );

    std::expected<Request, Error>
    receive(boost::asio::yield_context yield) override;

    std::optional<Error>
    send(Response response, SendMode mode, boost::asio::yield_context yield) override;

    void
    close(boost::asio::yield_context yield) override;
};

}  // namespace web::impl
