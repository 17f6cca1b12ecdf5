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

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>

#include <string_view>
#include <vector>

namespace proxy {

/**
 * @brief Selects the client headers that are copied onto the request sent to the destination.
 *
 * Header order and repeated headers are preserved. Headers that could not be written onto a request safely are
 * skipped and logged. Host is always set by the destination client and never comes from the client. Content-Length and
 * Transfer-Encoding describe the client's body, so they are recomputed for the outgoing request instead.
 */
class HeaderFilter {
    util::Logger log_{"Proxy"};
    std::vector<boost::beast::http::field> dropped_;

    explicit HeaderFilter(std::vector<boost::beast::http::field> dropped);

public:
    using HeaderList = std::vector<util::requests::HttpHeader>;

    /**
     * @brief Filter used for JSON-RPC calls; drops the framing headers since the body may be rewritten.
     *
     * @return The filter
     */
    static HeaderFilter
    rpc();

    /**
     * @brief Filter used for GET passthrough; copies every header except the framing of a body that is not sent.
     *
     * @return The filter
     */
    static HeaderFilter
    passthrough();

    /**
     * @brief Copy the accepted headers.
     *
     * @param headers The headers received from the client
     * @return The headers to send to the destination
     */
    [[nodiscard]] HeaderList
    apply(boost::beast::http::fields const& headers) const;

    /**
     * @brief Whether a header name consists of token characters only.
     *
     * @param name The header name
     * @return true if valid
     */
    [[nodiscard]] static bool
    isValidName(std::string_view name);

    /**
     * @brief Whether a header value can be written without breaking the message framing.
     *
     * @param value The header value
     * @return true if the value has no CR, LF or NUL characters
     */
    [[nodiscard]] static bool
    isValidValue(std::string_view value);
};

}  // namespace proxy
