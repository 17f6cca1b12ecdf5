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

#include "proxy/ForwardingPipeline.hpp"

#include "proxy/DestinationClientInterface.hpp"
#include "rpc/JsonRpc.hpp"
#include "rpc/MethodInterceptor.hpp"
#include "rpc/ResponseEnhancer.hpp"
#include "rpc/RewriteObserver.hpp"
#include "rpc/Types.hpp"
#include "util/Assert.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/Url.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/beast/http/status.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace http = boost::beast::http;

namespace proxy {

namespace {

void
logHeaders(util::Logger const& log, util::requests::HttpResponse const& response)
{
    for (auto const& header : response.base())
        LOG(log.debug()) << "  " << header.name_string() << ": " << header.value();
}

web::Response
internalError(web::Request const& request)
{
    return web::Response{http::status::internal_server_error, "Internal Server Error", request};
}

}  // namespace

ForwardingPipeline::ForwardingPipeline(
    std::shared_ptr<DestinationClientInterface const> destination,
    std::shared_ptr<rpc::RewriteObserver const> observer,
    rpc::MethodInterceptor interceptor,
    rpc::ResponseEnhancer enhancer
)
    : destination_{std::move(destination)}
    , observer_{std::move(observer)}
    , interceptor_{std::move(interceptor)}
    , enhancer_{std::move(enhancer)}
{
    ASSERT(destination_ != nullptr, "Destination client must be set");
    ASSERT(observer_ != nullptr, "Rewrite observer must be set");
}

web::Response
ForwardingPipeline::handleRpc(web::Request const& request, boost::asio::yield_context yield) const
{
    std::string method{kUNKNOWN_METHOD};
    std::string outgoing{request.body()};

    if (auto decoded = rpc::decodeRequest(request.body()); decoded.has_value()) {
        method = decoded->method;
        LOG(log_.info()) << "Received JSON-RPC request, method: " << method;

        auto interception = interceptor_.intercept(*decoded, *observer_);

        if (auto const* shortCircuit = std::get_if<rpc::ShortCircuit>(&interception); shortCircuit != nullptr) {
            auto encoded = rpc::encode(shortCircuit->response);
            if (not encoded.has_value()) {
                LOG(log_.error()) << "Failed to serialize response for " << method << ": " << encoded.error().message;
                return internalError(request);
            }

            LOG(log_.debug()) << "Answering without contacting destination: " << *encoded;
            return web::Response{
                http::status::ok, std::move(encoded).value(), web::Response::HttpData::ContentType::ApplicationJson, request
            };
        }

        auto const& rewritten = std::get<rpc::Rewritten<rpc::JsonRpcRequest>>(interception);
        if (rewritten.modified) {
            auto encoded = rpc::encode(rewritten.value);
            if (not encoded.has_value()) {
                LOG(log_.error()) << "Failed to serialize rewritten " << method << " request: "
                                  << encoded.error().message;
                return internalError(request);
            }

            outgoing = std::move(encoded).value();
            LOG(log_.debug()) << "Modified request body being sent to destination: " << outgoing;
        }
    } else {
        LOG(log_.info()) << "Forwarding body that is not a JSON-RPC request: " << decoded.error().message;
    }

    auto const headers = rpcHeaders_.apply(request.headers());
    auto response = destination_->post(std::move(outgoing), headers, yield);
    if (not response.has_value())
        return badGateway(request, response.error());

    LOG(log_.info()) << "Received response from destination, status: " << response->result_int()
                     << ", body length: " << response->body().size();
    logHeaders(log_, *response);

    auto enhanced = enhancer_.enhance(method, response->body(), *observer_);
    if (not enhanced.has_value()) {
        LOG(log_.error()) << "Failed to serialize enhanced response for " << method << ": "
                          << enhanced.error().message;
        return internalError(request);
    }

    if (enhanced->has_value()) {
        response->body() = std::move(*enhanced).value();
        // also drops chunked transfer encoding, the new body is sent in one piece
        response->content_length(response->body().size());
        LOG(log_.debug()) << "Enhanced response body: " << response->body();
    }

    return web::Response{std::move(response).value(), request};
}

web::Response
ForwardingPipeline::handleGet(web::Request const& request, boost::asio::yield_context yield) const
{
    return passthrough(request, request.query(), yield);
}

web::Response
ForwardingPipeline::handleFallback(web::Request const& request, boost::asio::yield_context yield) const
{
    return passthrough(request, std::nullopt, yield);
}

web::Response
ForwardingPipeline::passthrough(
    web::Request const& request,
    std::optional<std::string_view> rawQuery,
    boost::asio::yield_context yield
) const
{
    std::string query;
    if (rawQuery.has_value())
        query = util::requests::encodeQuery(util::requests::parseQuery(*rawQuery));

    LOG(log_.info()) << "Forwarding " << request.asHttpRequest().method_string() << " " << request.target()
                     << " as GET with query '" << query << "'";

    auto const headers = passthroughHeaders_.apply(request.headers());
    auto response = destination_->get(query, headers, yield);
    if (not response.has_value())
        return badGateway(request, response.error());

    LOG(log_.info()) << "Received GET response from destination, status: " << response->result_int()
                     << ", body length: " << response->body().size();
    logHeaders(log_, *response);

    return web::Response{std::move(response).value(), request};
}

web::Response
ForwardingPipeline::badGateway(web::Request const& request, util::requests::RequestError const& error) const
{
    LOG(log_.error()) << "Error forwarding request to destination: " << error.message();
    return web::Response{http::status::bad_gateway, std::string{}, request};
}

}  // namespace proxy
