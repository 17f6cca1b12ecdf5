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

#include "web/impl/HttpConnection.hpp"

#include "web/Connection.hpp"
#include "web/Error.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <utility>

namespace http = boost::beast::http;

namespace web::impl {

HttpConnection::HttpConnection(
    boost::asio::ip::tcp::socket socket,
    std::string clientIp,
    std::size_t bodyLimit,
    std::chrono::steady_clock::duration timeout
)
    : Connection{std::move(clientIp)}, stream_{std::move(socket)}, bodyLimit_{bodyLimit}, timeout_{timeout}
{
}

std::expected<Request, Error>
HttpConnection::receive(boost::asio::yield_context yield)
{
    http::request_parser<http::string_body> parser;
    parser.body_limit(bodyLimit_);

    Error error;
    stream_.expires_after(timeout_);
    http::async_read(stream_, buffer_, parser, yield[error]);
    if (error)
        return std::unexpected{error};

    return Request{parser.release()};
}

std::optional<Error>
HttpConnection::send(Response response, SendMode mode, boost::asio::yield_context yield)
{
    auto message = std::move(response).intoHttpResponse();
    http::response_serializer<http::string_body> serializer{message};

    Error error;
    stream_.expires_after(timeout_);
    if (mode == SendMode::HeadersOnly) {
        http::async_write_header(stream_, serializer, yield[error]);
    } else {
        http::async_write(stream_, serializer, yield[error]);
    }

    if (error)
        return error;
    return std::nullopt;
}

void
HttpConnection::close([[maybe_unused]] boost::asio::yield_context yield)
{
    Error ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
}

}  // namespace web::impl
