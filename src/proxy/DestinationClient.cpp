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

#include "proxy/DestinationClient.hpp"

#include "util/config/Config.hpp"
#include "util/requests/RequestBuilder.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/Url.hpp"

#include <boost/asio/spawn.hpp>
#include <boost/beast/http/verb.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace proxy {

using util::requests::HttpHeader;
using util::requests::HttpResponse;
using util::requests::RequestBuilder;
using util::requests::RequestError;
namespace http = boost::beast::http;

DestinationClient::DestinationClient(util::requests::Url url, std::chrono::milliseconds timeout, std::uint64_t bodyLimit)
    : url_{std::move(url)}, timeout_{timeout}, bodyLimit_{bodyLimit}
{
}

std::expected<HttpResponse, RequestError>
DestinationClient::post(std::string body, std::vector<HttpHeader> const& headers, boost::asio::yield_context yield)
    const
{
    RequestBuilder builder{url_};
    builder.setTimeout(timeout_).setBodyLimit(bodyLimit_).addHeaders(headers).setBody(std::move(body));
    return builder.send(http::verb::post, yield);
}

std::expected<HttpResponse, RequestError>
DestinationClient::get(std::string_view query, std::vector<HttpHeader> const& headers, boost::asio::yield_context yield)
    const
{
    RequestBuilder builder{url_};
    builder.setTarget(url_.targetWithQuery(query)).setTimeout(timeout_).setBodyLimit(bodyLimit_).addHeaders(headers);
    return builder.send(http::verb::get, yield);
}

util::requests::Url const&
DestinationClient::url() const
{
    return url_;
}

std::expected<DestinationClient, std::string>
make_DestinationClient(util::Config const& config)
{
    std::string rawUrl;
    std::chrono::milliseconds timeout{};
    std::uint64_t bodyLimit = 0;

    try {
        auto const section = config.sectionOr("destination", {});
        auto const maybeUrl = section.maybeValue<std::string>("url");
        if (not maybeUrl.has_value())
            return std::unexpected{"Destination URL is not set; use --dest or destination.url"};

        rawUrl = *maybeUrl;
        timeout = std::chrono::milliseconds{section.valueOr<std::uint64_t>("timeout_ms", kDEFAULT_TIMEOUT.count())};
        bodyLimit = section.valueOr<std::uint64_t>("max_response_size", kDEFAULT_MAX_RESPONSE_SIZE);
    } catch (std::exception const& e) {
        return std::unexpected{fmt::format("Invalid destination configuration: {}", e.what())};
    }

    if (timeout.count() == 0)
        return std::unexpected{"destination.timeout_ms must be positive"};

    auto url = util::requests::parseUrl(rawUrl);
    if (not url.has_value())
        return std::unexpected{fmt::format("Invalid destination URL '{}': {}", rawUrl, url.error())};

    return DestinationClient{std::move(url).value(), timeout, bodyLimit};
}

}  // namespace proxy
