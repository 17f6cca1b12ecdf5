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

#include "util/StringHash.hpp"
#include "util/log/Logger.hpp"
#include "web/Connection.hpp"
#include "web/Error.hpp"
#include "web/MessageHandler.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace web::impl {

/**
 * @brief Runs the request/response loop of a connection and routes each request to its handler.
 *
 * Requests are routed on the path of the target, so a query string does not affect routing. HEAD requests are routed
 * like GET and answered with the headers only. Requests matching no route go to the fallback handler when one is set.
 */
class ConnectionHandler {
public:
    using TargetToHandlerMap = std::unordered_map<std::string, MessageHandler, util::StringHash, std::equal_to<>>;

private:
    util::Logger log_{"WebServer"};

    TargetToHandlerMap getHandlers_;
    TargetToHandlerMap postHandlers_;
    std::optional<MessageHandler> fallbackHandler_;

public:
    void
    onGet(std::string const& target, MessageHandler handler);

    void
    onPost(std::string const& target, MessageHandler handler);

    void
    onFallback(MessageHandler handler);

    /**
     * @brief Serve requests from the connection until the client disconnects or an error occurs.
     *
     * A request body over the size limit is answered with 413 before the connection is closed.
     */
    void
    processConnection(ConnectionPtr connection, boost::asio::yield_context yield);

private:
    // returns whether the connection still needs to be closed
    bool
    handleError(Error const& error, Connection& connection, boost::asio::yield_context yield) const;

    bool
    requestResponseLoop(Connection& connection, boost::asio::yield_context yield);

    Response
    handleRequest(Request const& request, boost::asio::yield_context yield);

    Response
    dispatch(TargetToHandlerMap const& handlers, Request const& request, boost::asio::yield_context yield);
};

}  // namespace web::impl
