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

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <optional>
#include <string_view>

namespace web {

/**
 * @brief A request read from a client connection.
 */
class Request {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpHeaders = HttpRequest::header_type;

    /** HEAD is told apart from GET so that it can be answered with headers only. */
    enum class Method { GET, POST, HEAD, UNSUPPORTED };

    explicit Request(HttpRequest request);

    Method
    method() const;

    HttpRequest const&
    asHttpRequest() const;

    std::string_view
    body() const;

    /** The request target as received, query included. */
    std::string_view
    target() const;

    /** The target up to the first '?'. */
    std::string_view
    path() const;

    /**
     * @brief The raw text after the first '?'.
     *
     * @return std::nullopt when the target has no '?' at all, an empty view for a trailing '?'
     */
    std::optional<std::string_view>
    query() const;

    HttpHeaders const&
    headers() const;

private:
    HttpRequest request_;
};

}  // namespace web
