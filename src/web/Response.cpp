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

#include "web/Response.hpp"

#include "util/Assert.hpp"
#include "util/build/Build.hpp"
#include "web/Request.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace http = boost::beast::http;
namespace web {

namespace {

std::string_view
asString(Response::HttpData::ContentType type)
{
    switch (type) {
        case Response::HttpData::ContentType::TextPlain:
            return "text/plain";
        case Response::HttpData::ContentType::ApplicationJson:
            return "application/json";
    }
    ASSERT(false, "Unknown content type");
    std::unreachable();
}

Response::HttpData
makeHttpData(http::status status, Response::HttpData::ContentType contentType, Request const& request)
{
    auto const& httpRequest = request.asHttpRequest();
    return Response::HttpData{
        .status = status,
        .contentType = contentType,
        .keepAlive = httpRequest.keep_alive(),
        .version = httpRequest.version()
    };
}

}  // namespace

Response::Response(boost::beast::http::status status, std::string message, Request const& request)
    : Response(status, std::move(message), HttpData::ContentType::TextPlain, request)
{
}

Response::Response(boost::beast::http::status status, boost::json::object const& message, Request const& request)
    : Response(status, boost::json::serialize(message), HttpData::ContentType::ApplicationJson, request)
{
}

Response::Response(
    boost::beast::http::status status,
    std::string message,
    HttpData::ContentType contentType,
    Request const& request
)
    : data_{Generated{.message = std::move(message), .httpData = makeHttpData(status, contentType, request)}}
{
}

Response::Response(boost::beast::http::status status, std::string message)
    : data_{Generated{
          .message = std::move(message),
          .httpData = {.status = status, .contentType = HttpData::ContentType::TextPlain, .keepAlive = false, .version = 11}
      }}
{
}

Response::Response(HttpResponse relayed, Request const& request) : data_{std::move(relayed)}
{
    auto& response = std::get<HttpResponse>(data_);
    auto const& httpRequest = request.asHttpRequest();

    response.version(httpRequest.version());
    response.keep_alive(httpRequest.keep_alive());

    auto const status = response.result_int();
    if (status / 100 == 1 or status == 204 or status == 304) {
        response.chunked(false);
        return;
    }

    // clears any chunked coding, an HTTP/1.0 client could not decode it
    response.content_length(response.body().size());
}

http::status
Response::status() const
{
    if (auto const* generated = std::get_if<Generated>(&data_); generated != nullptr)
        return generated->httpData.status;
    return std::get<HttpResponse>(data_).result();
}

std::string const&
Response::message() const
{
    if (auto const* generated = std::get_if<Generated>(&data_); generated != nullptr)
        return generated->message;
    return std::get<HttpResponse>(data_).body();
}

bool
Response::isRelayed() const
{
    return std::holds_alternative<HttpResponse>(data_);
}

Response::HttpResponse
Response::intoHttpResponse() &&
{
    if (isRelayed())
        return std::get<HttpResponse>(std::move(data_));

    auto& generated = std::get<Generated>(data_);
    HttpResponse result{generated.httpData.status, generated.httpData.version};
    result.set(http::field::server, fmt::format("tronbridge/{}", util::build::getTronbridgeVersionString()));
    result.set(http::field::content_type, asString(generated.httpData.contentType));
    result.keep_alive(generated.httpData.keepAlive);
    result.body() = std::move(generated.message);
    result.prepare_payload();
    return result;
}

}  // namespace web
