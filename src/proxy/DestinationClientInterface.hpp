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

#include "util/requests/Types.hpp"

#include <boost/asio/spawn.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace proxy {

/**
 * @brief The interface of the client used to reach the destination.
 */
class DestinationClientInterface {
public:
    virtual ~DestinationClientInterface() = default;

    /**
     * @brief Send a POST with the given body to the destination URL.
     *
     * @param body The request body
     * @param headers The headers to send
     * @param yield The coroutine context
     * @return The destination's response whatever its status, or an error if no response was received
     */
    virtual std::expected<util::requests::HttpResponse, util::requests::RequestError>
    post(std::string body, std::vector<util::requests::HttpHeader> const& headers, boost::asio::yield_context yield)
        const = 0;

    /**
     * @brief Send a GET to the destination URL.
     *
     * @param query The encoded query to append to the destination URL; may be empty
     * @param headers The headers to send
     * @param yield The coroutine context
     * @return The destination's response whatever its status, or an error if no response was received
     */
    virtual std::expected<util::requests::HttpResponse, util::requests::RequestError>
    get(std::string_view query,
        std::vector<util::requests::HttpHeader> const& headers,
        boost::asio::yield_context yield) const = 0;
};

}  // namespace proxy
