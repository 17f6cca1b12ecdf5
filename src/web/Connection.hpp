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

#include "web/Error.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace web {

/**
 * @brief One client connection as seen by the request loop.
 */
class Connection {
    std::string clientIp_;

public:
    enum class SendMode { Full, HeadersOnly };

    explicit Connection(std::string clientIp) : clientIp_{std::move(clientIp)}
    {
    }

    virtual ~Connection() = default;

    /**
     * @brief Read the next request. A body over the size limit is reported as http::error::body_limit.
     */
    virtual std::expected<Request, Error>
    receive(boost::asio::yield_context yield) = 0;

    /**
     * @brief Write a response; HeadersOnly leaves the body out while keeping its Content-Length, as HEAD requires.
     */
    virtual std::optional<Error>
    send(Response response, SendMode mode, boost::asio::yield_context yield) = 0;

    virtual void
    close(boost::asio::yield_context yield) = 0;

    std::string const&
    clientIp() const
    {
        return clientIp_;
    }
};

using ConnectionPtr = std::unique_ptr<Connection>;

}  // namespace web
