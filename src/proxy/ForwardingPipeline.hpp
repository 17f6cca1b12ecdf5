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

#include "proxy/DestinationClientInterface.hpp"
#include "proxy/HeaderFilter.hpp"
#include "rpc/MethodInterceptor.hpp"
#include "rpc/ResponseEnhancer.hpp"
#include "rpc/RewriteObserver.hpp"
#include "util/log/Logger.hpp"
#include "util/requests/Types.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>

#include <memory>
#include <optional>
#include <string_view>

namespace proxy {

/**
 * @brief Forwards client requests to the destination, applying the JSON-RPC rewrites on the way in and out.
 *
 * Holds no per-request state; a single instance serves all connections concurrently.
 */
class ForwardingPipeline {
    util::Logger log_{"Proxy"};
    std::shared_ptr<DestinationClientInterface const> destination_;
    std::shared_ptr<rpc::RewriteObserver const> observer_;
    rpc::MethodInterceptor interceptor_;
    rpc::ResponseEnhancer enhancer_;
    HeaderFilter rpcHeaders_ = HeaderFilter::rpc();
    HeaderFilter passthroughHeaders_ = HeaderFilter::passthrough();

public:
    /** @brief The method name used for enhancement dispatch when the body is not a JSON-RPC request */
    static constexpr std::string_view kUNKNOWN_METHOD = "unknown";

    /**
     * @brief Construct a new pipeline
     *
     * @param destination The client used to reach the destination
     * @param observer Notified about every rewrite
     * @param interceptor The request rules
     * @param enhancer The response rules
     */
    ForwardingPipeline(
        std::shared_ptr<DestinationClientInterface const> destination,
        std::shared_ptr<rpc::RewriteObserver const> observer,
        rpc::MethodInterceptor interceptor = {},
        rpc::ResponseEnhancer enhancer = {}
    );

    /**
     * @brief Handle a JSON-RPC call.
     *
     * Bodies that are not JSON-RPC requests are forwarded untouched. Responses are 502 if the destination could not
     * be reached and 500 if a rewritten message could not be serialized.
     *
     * @param request The client request
     * @param yield The coroutine context
     * @return The response for the client
     */
    web::Response
    handleRpc(web::Request const& request, boost::asio::yield_context yield) const;

    /**
     * @brief Relay a GET, re-encoding the client's query parameters onto the destination URL.
     *
     * @param request The client request
     * @param yield The coroutine context
     * @return The destination's response unchanged, or 502 if it could not be reached
     */
    web::Response
    handleGet(web::Request const& request, boost::asio::yield_context yield) const;

    /**
     * @brief Relay any other request as a GET to the destination URL without a query.
     *
     * @param request The client request
     * @param yield The coroutine context
     * @return The destination's response unchanged, or 502 if it could not be reached
     */
    web::Response
    handleFallback(web::Request const& request, boost::asio::yield_context yield) const;

private:
    web::Response
    passthrough(web::Request const& request, std::optional<std::string_view> rawQuery, boost::asio::yield_context yield)
        const;

    web::Response
    badGateway(web::Request const& request, util::requests::RequestError const& error) const;
};

}  // namespace proxy
