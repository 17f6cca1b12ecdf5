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

#include "util/log/Logger.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/Url.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace util::requests {

/**
 * @brief Builds one HTTP request to a URL and performs it on a fresh connection.
 *
 * https URLs are sent over TLS with the peer certificate checked against the system trust store and the host name.
 * The Host header is always the authority of the URL. Any response, whatever its status, is returned as is.
 */
class RequestBuilder {
    util::Logger log_{"Requests"};
    Url url_;
    std::chrono::milliseconds timeout_{kDEFAULT_TIMEOUT};
    std::uint64_t bodyLimit_{kDEFAULT_BODY_LIMIT};
    boost::beast::http::request<boost::beast::http::string_body> request_;

public:
    static constexpr std::chrono::milliseconds kDEFAULT_TIMEOUT{30000};
    static constexpr std::uint64_t kDEFAULT_BODY_LIMIT = 64 * 1024 * 1024;

    explicit RequestBuilder(Url url);

    /**
     * @brief Replace the request target taken from the URL.
     */
    RequestBuilder&
    setTarget(std::string target);

    /**
     * @brief Append headers; repeated names are all sent, in order.
     */
    RequestBuilder&
    addHeaders(std::vector<HttpHeader> const& headers);

    RequestBuilder&
    setBody(std::string body);

    /**
     * @brief Limit for each of connect, handshake, write and read.
     */
    RequestBuilder&
    setTimeout(std::chrono::milliseconds timeout);

    RequestBuilder&
    setBodyLimit(std::uint64_t limit);

    /**
     * @brief Perform the request.
     *
     * Interim 1xx responses are skipped. Content-Length is computed from the body, never copied from added headers.
     *
     * @param method The HTTP method
     * @param yield The coroutine to suspend while waiting
     * @return The final response, or what failed on the way to it
     */
    std::expected<HttpResponse, RequestError>
    send(boost::beast::http::verb method, boost::asio::yield_context yield);

private:
    template <typename Stream>
    std::expected<HttpResponse, RequestError>
    exchange(
        Stream& stream,
        boost::asio::ip::tcp::resolver::results_type const& endpoints,
        boost::asio::yield_context yield
    );
};

}  // namespace util::requests
