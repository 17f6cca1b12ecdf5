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

#include "util/requests/RequestBuilder.hpp"

#include "util/log/Logger.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/Url.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/ssl/verify_mode.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace util::requests {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

using SslStream = beast::ssl_stream<beast::tcp_stream>;

std::expected<ssl::context, RequestError>
makeClientContext()
{
    ssl::context context{ssl::context::tls_client};
    context.set_verify_mode(ssl::verify_peer);

    beast::error_code errorCode;
    context.set_default_verify_paths(errorCode);
    if (errorCode)
        return std::unexpected{RequestError{"SSL setup failed", errorCode}};
    return context;
}

std::string
describeSslError(beast::error_code const& errorCode)
{
    std::array<char, 256> text{};
    ::ERR_error_string_n(static_cast<unsigned long>(errorCode.value()), text.data(), text.size());
    return text.data();
}

}  // namespace

RequestBuilder::RequestBuilder(Url url) : url_(std::move(url))
{
    request_.target(url_.target);
}

RequestBuilder&
RequestBuilder::setTarget(std::string target)
{
    request_.target(target);
    return *this;
}

RequestBuilder&
RequestBuilder::addHeaders(std::vector<HttpHeader> const& headers)
{
    for (auto const& [name, value] : headers)
        request_.insert(name, value);
    return *this;
}

RequestBuilder&
RequestBuilder::setBody(std::string body)
{
    request_.body() = std::move(body);
    return *this;
}

RequestBuilder&
RequestBuilder::setTimeout(std::chrono::milliseconds timeout)
{
    timeout_ = timeout;
    return *this;
}

RequestBuilder&
RequestBuilder::setBodyLimit(std::uint64_t limit)
{
    bodyLimit_ = limit;
    return *this;
}

std::expected<HttpResponse, RequestError>
RequestBuilder::send(http::verb method, asio::yield_context yield)
{
    request_.method(method);
    request_.set(http::field::host, url_.authority());
    request_.erase(http::field::content_length);
    request_.erase(http::field::transfer_encoding);
    request_.prepare_payload();

    auto const executor = asio::get_associated_executor(yield);

    beast::error_code errorCode;
    tcp::resolver resolver{executor};
    auto const endpoints = resolver.async_resolve(url_.host, url_.port, yield[errorCode]);
    if (errorCode)
        return std::unexpected{RequestError{"Resolve error", errorCode}};

    if (not url_.isSsl()) {
        beast::tcp_stream stream{executor};
        return exchange(stream, endpoints, yield);
    }

    auto context = makeClientContext();
    if (not context.has_value())
        return std::unexpected{std::move(context).error()};

    SslStream stream{executor, *context};
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
    if (SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str()) != 1) {
#pragma GCC diagnostic pop
        beast::error_code const sniError{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        return std::unexpected{RequestError{"SSL setup failed", sniError}};
    }
    stream.set_verify_callback(ssl::host_name_verification{url_.host});

    return exchange(stream, endpoints, yield);
}

template <typename Stream>
std::expected<HttpResponse, RequestError>
RequestBuilder::exchange(Stream& stream, tcp::resolver::results_type const& endpoints, asio::yield_context yield)
{
    auto& socketStream = beast::get_lowest_layer(stream);
    beast::error_code errorCode;

    socketStream.expires_after(timeout_);
    socketStream.async_connect(endpoints, yield[errorCode]);
    if (errorCode)
        return std::unexpected{RequestError{"Connection error", errorCode}};

    if constexpr (std::is_same_v<Stream, SslStream>) {
        socketStream.expires_after(timeout_);
        stream.async_handshake(ssl::stream_base::client, yield[errorCode]);
        if (errorCode) {
            if (errorCode.category() == asio::error::get_ssl_category())
                LOG(log_.debug()) << "TLS handshake with " << url_.host << " failed: " << describeSslError(errorCode);
            return std::unexpected{RequestError{"Handshake error", errorCode}};
        }
    }

    socketStream.expires_after(timeout_);
    http::async_write(stream, request_, yield[errorCode]);
    if (errorCode)
        return std::unexpected{RequestError{"Write error", errorCode}};

    beast::flat_buffer buffer;
    HttpResponse response;
    do {
        http::response_parser<http::string_body> parser;
        parser.body_limit(bodyLimit_);

        socketStream.expires_after(timeout_);
        http::async_read(stream, buffer, parser, yield[errorCode]);
        if (errorCode)
            return std::unexpected{RequestError{"Read error", errorCode}};

        response = parser.release();
    } while (http::to_status_class(response.result()) == http::status_class::informational and
             response.result() != http::status::switching_protocols);

    socketStream.socket().shutdown(tcp::socket::shutdown_both, errorCode);
    if (errorCode and errorCode != beast::errc::not_connected)
        LOG(log_.debug()) << "Shutting down the connection to " << url_.host << " failed: " << errorCode.message();

    return response;
}

}  // namespace util::requests
