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

#include "web/impl/ConnectionHandler.hpp"

#include "util/log/Logger.hpp"
#include "web/Connection.hpp"
#include "web/Error.hpp"
#include "web/MessageHandler.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/status.hpp>

#include <optional>
#include <string>
#include <utility>

namespace web::impl {

void
ConnectionHandler::onGet(std::string const& target, MessageHandler handler)
{
    getHandlers_[target] = std::move(handler);
}

void
ConnectionHandler::onPost(std::string const& target, MessageHandler handler)
{
    postHandlers_[target] = std::move(handler);
}

void
ConnectionHandler::onFallback(MessageHandler handler)
{
    fallbackHandler_ = std::move(handler);
}

void
ConnectionHandler::processConnection(ConnectionPtr connectionPtr, boost::asio::yield_context yield)
{
    if (requestResponseLoop(*connectionPtr, yield))
        connectionPtr->close(yield);
}

bool
ConnectionHandler::handleError(Error const& error, Connection& connection, boost::asio::yield_context yield) const
{
    namespace http = boost::beast::http;

    if (error == http::error::end_of_stream) {
        LOG(log_.trace()) << "Client " << connection.clientIp() << " closed the connection";
        return false;
    }

    if (error == http::error::body_limit) {
        LOG(log_.warn()) << "Request from " << connection.clientIp() << " exceeds the size limit, answering 413";
        auto const sendError = connection.send(
            Response{http::status::payload_too_large, "Payload Too Large"}, Connection::SendMode::Full, yield
        );
        if (sendError.has_value())
            LOG(log_.debug()) << "Could not send 413 to " << connection.clientIp() << ": " << sendError->message();
    } else if (error == boost::beast::error::timeout) {
        LOG(log_.debug()) << "Connection with " << connection.clientIp() << " timed out";
    } else if (error != boost::asio::error::operation_aborted) {
        LOG(log_.error()) << "Connection with " << connection.clientIp() << " failed: " << error.message();
    }
    return true;
}

bool
ConnectionHandler::requestResponseLoop(Connection& connection, boost::asio::yield_context yield)
{
    // one iteration per request while the client keeps the connection alive
    while (true) {
        auto request = connection.receive(yield);
        if (not request.has_value())
            return handleError(request.error(), connection, yield);

        LOG(log_.info()) << "Received " << request->asHttpRequest().method_string() << " " << request->target()
                         << " from " << connection.clientIp();

        auto const mode =
            request->method() == Request::Method::HEAD ? Connection::SendMode::HeadersOnly : Connection::SendMode::Full;
        if (auto const error = connection.send(handleRequest(*request, yield), mode, yield); error.has_value())
            return handleError(*error, connection, yield);

        if (not request->asHttpRequest().keep_alive())
            return true;
    }
}

Response
ConnectionHandler::handleRequest(Request const& request, boost::asio::yield_context yield)
{
    switch (request.method()) {
        case Request::Method::GET:
        case Request::Method::HEAD:
            return dispatch(getHandlers_, request, yield);
        case Request::Method::POST:
            return dispatch(postHandlers_, request, yield);
        default:
            break;
    }

    if (fallbackHandler_.has_value())
        return fallbackHandler_->operator()(request, yield);
    return Response{boost::beast::http::status::bad_request, "Unsupported http method", request};
}

Response
ConnectionHandler::dispatch(TargetToHandlerMap const& handlers, Request const& request, boost::asio::yield_context yield)
{
    auto it = handlers.find(request.path());
    if (it != handlers.end())
        return it->second(request, yield);

    if (fallbackHandler_.has_value())
        return fallbackHandler_->operator()(request, yield);
    return Response{boost::beast::http::status::bad_request, "Bad target", request};
}

}  // namespace web::impl
