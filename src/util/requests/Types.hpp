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

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <optional>
#include <string>

namespace util::requests {

/**
 * @brief Why a request got no HTTP response. A response with an error status is not a RequestError.
 */
class RequestError {
    std::string message_;
    std::optional<boost::beast::error_code> errorCode_;

public:
    /**
     * @param message What failed, e.g. "Connection error"
     * @param errorCode The transport error; its message is appended to the text
     */
    explicit RequestError(std::string message, std::optional<boost::beast::error_code> errorCode = std::nullopt);

    std::string const&
    message() const
    {
        return message_;
    }

    std::optional<boost::beast::error_code> const&
    errorCode() const
    {
        return errorCode_;
    }
};

/**
 * @brief A header to add to an outgoing request, written exactly as given.
 */
struct HttpHeader {
    std::string name;
    std::string value;

    bool
    operator==(HttpHeader const&) const = default;
};

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

}  // namespace util::requests
