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

#include "util/AsioContextTest.hpp"
#include "util/HttpPeers.hpp"
#include "util/NameGenerator.hpp"
#include "util/requests/RequestBuilder.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/Url.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <fmt/core.h>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace util::requests;
using tests::util::FakeDestination;
using tests::util::HttpRequest;
using tests::util::HttpResponse;
namespace asio = boost::asio;
namespace http = boost::beast::http;

namespace {

Url
urlOf(std::string_view text)
{
    auto url = parseUrl(text);
    EXPECT_TRUE(url.has_value()) << text;
    return url.value_or(Url{});
}

std::vector<std::string>
valuesOf(HttpRequest const& request, std::string_view name)
{
    std::vector<std::string> values;
    auto const [begin, end] = request.equal_range(name);
    for (auto it = begin; it != end; ++it)
        values.emplace_back(it->value());
    return values;
}

}  // namespace

struct RequestBuilderTest : AsioContextTest {
    FakeDestination destination{ctx};
    RequestBuilder builder{urlOf(destination.url())};
};

struct SentRequestBundle {
    std::string testName;
    http::verb method;
    std::string target;
    std::vector<HttpHeader> headers;
};

struct RequestBuilderSentRequestTest : RequestBuilderTest, testing::WithParamInterface<SentRequestBundle> {};

INSTANTIATE_TEST_CASE_P(
    SentRequests,
    RequestBuilderSentRequestTest,
    testing::Values(
        SentRequestBundle{"GetRoot", http::verb::get, "/", {}},
        SentRequestBundle{"GetWithQuery", http::verb::get, "/wallet/getnowblock?visible=true", {}},
        SentRequestBundle{"GetWithHeaders", http::verb::get, "/", {{"Accept", "text/html"}, {"X-Api-Key", "k1"}}},
        SentRequestBundle{"PostRoot", http::verb::post, "/", {}},
        SentRequestBundle{"PostToPath", http::verb::post, "/jsonrpc", {{"Authorization", "Basic dTpw"}}}
    ),
    tests::util::NameGenerator
);

TEST_P(RequestBuilderSentRequestTest, DestinationSeesMethodTargetAndHeaders)
{
    auto const& param = GetParam();
    builder.setTarget(param.target).addHeaders(param.headers);

    destination.expectRequest([&param](HttpRequest request) -> std::optional<HttpResponse> {
        EXPECT_EQ(request.method(), param.method);
        EXPECT_EQ(request.target(), param.target);
        for (auto const& [name, value] : param.headers)
            EXPECT_EQ(valuesOf(request, name), std::vector<std::string>{value}) << name;
        return HttpResponse{http::status::ok, 11, "pong"};
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(param.method, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
        EXPECT_EQ(response->result(), http::status::ok);
        EXPECT_EQ(response->body(), "pong");
    });
}

TEST_F(RequestBuilderTest, PostCarriesBodyWithComputedLength)
{
    std::string const body = R"({"jsonrpc":"2.0","method":"eth_blockNumber","id":7})";
    builder.addHeaders({{"Content-Length", "3"}, {"Transfer-Encoding", "chunked"}}).setBody(body);

    destination.expectRequest([&body](HttpRequest request) -> std::optional<HttpResponse> {
        EXPECT_EQ(request.body(), body);
        EXPECT_EQ(request[http::field::content_length], std::to_string(body.size()));
        EXPECT_EQ(request.count(http::field::transfer_encoding), 0u);
        return HttpResponse{http::status::ok, 11, R"({"jsonrpc":"2.0","result":"0x10","id":7})"};
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::post, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
        EXPECT_EQ(response->body(), R"({"jsonrpc":"2.0","result":"0x10","id":7})");
    });
}

TEST_F(RequestBuilderTest, GetWithCopiedContentLengthSendsNoBodyFraming)
{
    builder.addHeaders({{"Content-Length", "7"}});

    destination.expectRequest([](HttpRequest request) -> std::optional<HttpResponse> {
        EXPECT_EQ(request.count(http::field::content_length), 0u);
        EXPECT_TRUE(request.body().empty());
        return HttpResponse{http::status::ok, 11, "ok"};
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::get, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
    });
}

TEST_F(RequestBuilderTest, HostIsAlwaysTheDestinationAuthority)
{
    builder.addHeaders({{"Host", "client.example"}});

    destination.expectRequest([this](HttpRequest request) -> std::optional<HttpResponse> {
        EXPECT_EQ(valuesOf(request, "Host"), std::vector<std::string>{fmt::format("127.0.0.1:{}", destination.port())});
        return HttpResponse{http::status::ok, 11, ""};
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::get, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
    });
}

TEST_F(RequestBuilderTest, RepeatedHeaderNamesKeepTheirOrder)
{
    builder.addHeaders({{"X-Forwarded-For", "10.0.0.1"}, {"Accept", "*/*"}, {"X-Forwarded-For", "10.0.0.2"}});

    destination.expectRequest([](HttpRequest request) -> std::optional<HttpResponse> {
        EXPECT_EQ(valuesOf(request, "X-Forwarded-For"), (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
        return HttpResponse{http::status::ok, 11, ""};
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::get, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
    });
}

TEST_F(RequestBuilderTest, ErrorStatusIsReturnedAsResponse)
{
    destination.expectRequest([](HttpRequest) -> std::optional<HttpResponse> {
        HttpResponse response{http::status::service_unavailable, 11, "busy"};
        response.set("Retry-After", "3");
        return response;
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::get, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
        EXPECT_EQ(response->result(), http::status::service_unavailable);
        EXPECT_EQ(response->body(), "busy");
        EXPECT_EQ((*response)["Retry-After"], "3");
    });
}

TEST_F(RequestBuilderTest, ChunkedResponseIsDecoded)
{
    destination.expectRequest([](HttpRequest) -> std::optional<HttpResponse> {
        HttpResponse response{http::status::ok, 11, R"({"jsonrpc":"2.0","result":true,"id":1})"};
        response.chunked(true);
        return response;
    });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::post, yield);
        ASSERT_TRUE(response.has_value()) << response.error().message();
        EXPECT_TRUE(response->chunked());
        EXPECT_EQ(response->body(), R"({"jsonrpc":"2.0","result":true,"id":1})");
    });
}

TEST_F(RequestBuilderTest, ResolveError)
{
    RequestBuilder unresolvable{urlOf("http://wrong_host:1")};
    runSpawn([&](asio::yield_context yield) {
        auto const response = unresolvable.send(http::verb::get, yield);
        ASSERT_FALSE(response.has_value());
        EXPECT_TRUE(response.error().message().starts_with("Resolve error")) << response.error().message();
        EXPECT_TRUE(response.error().errorCode().has_value());
    });
}

TEST_F(RequestBuilderTest, ConnectionError)
{
    RequestBuilder refused{urlOf(fmt::format("http://127.0.0.1:{}", tests::util::unusedPort()))};
    refused.setTimeout(std::chrono::milliseconds{500});
    runSpawn([&](asio::yield_context yield) {
        auto const response = refused.send(http::verb::get, yield);
        ASSERT_FALSE(response.has_value());
        EXPECT_TRUE(response.error().message().starts_with("Connection error")) << response.error().message();
    });
}

TEST_F(RequestBuilderTest, ClosedWithoutResponseIsReadError)
{
    destination.expectRequest([](HttpRequest) -> std::optional<HttpResponse> { return std::nullopt; });

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::get, yield);
        ASSERT_FALSE(response.has_value());
        EXPECT_TRUE(response.error().message().starts_with("Read error")) << response.error().message();
    });
}

TEST_F(RequestBuilderTest, SilentDestinationTimesOut)
{
    // accepts connections into the backlog and never answers
    asio::ip::tcp::acceptor silent{ctx, {asio::ip::address_v4::loopback(), 0}};
    RequestBuilder waiting{urlOf(fmt::format("http://127.0.0.1:{}", silent.local_endpoint().port()))};
    waiting.setTimeout(std::chrono::milliseconds{50});

    runSpawn([&](asio::yield_context yield) {
        auto const response = waiting.send(http::verb::get, yield);
        ASSERT_FALSE(response.has_value());
        EXPECT_TRUE(response.error().message().starts_with("Read error")) << response.error().message();
        ASSERT_TRUE(response.error().errorCode().has_value());
        EXPECT_EQ(*response.error().errorCode(), boost::beast::error_code{boost::beast::error::timeout});
    });
}

TEST_F(RequestBuilderTest, ResponseOverBodyLimitIsReadError)
{
    builder.setBodyLimit(4);
    destination.expectRequest(
        [](HttpRequest) -> std::optional<HttpResponse> {
            HttpResponse response{http::status::ok, 11, "more than four bytes"};
            response.prepare_payload();
            return response;
        },
        true
    );

    runSpawn([&](asio::yield_context yield) {
        auto const response = builder.send(http::verb::get, yield);
        ASSERT_FALSE(response.has_value());
        EXPECT_TRUE(response.error().message().starts_with("Read error")) << response.error().message();
    });
}

struct RequestBuilderTlsTest : RequestBuilderTest, testing::WithParamInterface<http::verb> {};

INSTANTIATE_TEST_CASE_P(TlsMethods, RequestBuilderTlsTest, testing::Values(http::verb::get, http::verb::post));

TEST_P(RequestBuilderTlsTest, HttpsAgainstPlainDestinationFailsHandshake)
{
    RequestBuilder tls{urlOf(fmt::format("https://127.0.0.1:{}", destination.port()))};
    tls.setTimeout(std::chrono::milliseconds{500});
    destination.expectRequest(
        [](HttpRequest) -> std::optional<HttpResponse> {
            ADD_FAILURE() << "A TLS hello must not parse as an HTTP request";
            return std::nullopt;
        },
        true
    );

    runSpawn([&](asio::yield_context yield) {
        auto const response = tls.send(GetParam(), yield);
        ASSERT_FALSE(response.has_value());
        EXPECT_TRUE(response.error().message().starts_with("Handshake error")) << response.error().message();
    });
}
