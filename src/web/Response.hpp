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

#include "web/Request.hpp"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json/object.hpp>

#include <string>
#include <variant>

namespace web {

/**
 * @brief What the proxy sends back to a client: either a body it produced itself or a destination response.
 *
 * The HTTP version and keep alive flag always follow the client's request.
 */
class Response {
public:
    struct HttpData {
        enum class ContentType { ApplicationJson, TextPlain };

        boost::beast::http::status status;
        ContentType contentType;
        bool keepAlive;
        unsigned int version;
    };

    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

private:
    struct Generated {
        std::string message;
        HttpData httpData;
    };

    std::variant<Generated, HttpResponse> data_;

public:
    /**
     * @brief A text/plain response to request.
     */
    Response(boost::beast::http::status status, std::string message, Request const& request);

    Response(boost::beast::http::status status, boost::json::object const& message, Request const& request);

    Response(
        boost::beast::http::status status,
        std::string message,
        HttpData::ContentType contentType,
        Request const& request
    );

    /**
     * @brief A text/plain HTTP/1.1 response for a request that could not be read; the connection is closed after it.
     */
    Response(boost::beast::http::status status, std::string message);

    /**
     * @brief Relay a destination response.
     *
     * Status, headers and body are kept. The body is always framed by Content-Length since it is fully buffered,
     * which replaces chunked transfer encoding. Responses that can not have a body just lose the chunked coding.
     */
    Response(HttpResponse relayed, Request const& request);

    [[nodiscard]] boost::beast::http::status
    status() const;

    [[nodiscard]] std::string const&
    message() const;

    [[nodiscard]] bool
    isRelayed() const;

    HttpResponse
    intoHttpResponse() &&;
};

}  // namespace web
