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

#include "util/build/Build.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/json/object.hpp>
#include <fmt/core.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>

using namespace web;
namespace http = boost::beast::http;

struct ResponseTest : testing::Test {
    static Request
    makeRequest(unsigned int version = 11, bool keepAlive = true)
    {
        http::request<http::string_body> request{http::verb::post, "/", version};
        request.keep_alive(keepAlive);
        return Request{std::move(request)};
    }
};

TEST_F(ResponseTest, GeneratedPlainText)
{
    auto const request = makeRequest();
    Response response{http::status::bad_request, "Bad target", request};

    EXPECT_FALSE(response.isRelayed());
    EXPECT_EQ(response.status(), http::status::bad_request);
    EXPECT_EQ(response.message(), "Bad target");

    auto const httpResponse = std::move(response).intoHttpResponse();
    EXPECT_EQ(httpResponse.result(), http::status::bad_request);
    EXPECT_EQ(httpResponse.body(), "Bad target");
    EXPECT_EQ(httpResponse.at(http::field::content_type), "text/plain");
    EXPECT_EQ(
        httpResponse.at(http::field::server), fmt::format("tronbridge/{}", util::build::getTronbridgeVersionString())
    );
    EXPECT_EQ(httpResponse.at(http::field::content_length), "10");
    EXPECT_EQ(httpResponse.version(), 11);
    EXPECT_TRUE(httpResponse.keep_alive());
}

TEST_F(ResponseTest, GeneratedJson)
{
    auto const request = makeRequest();
    Response response{http::status::ok, boost::json::object{{"jsonrpc", "2.0"}, {"result", "0x0"}}, request};

    EXPECT_EQ(response.message(), R"({"jsonrpc":"2.0","result":"0x0"})");

    auto const httpResponse = std::move(response).intoHttpResponse();
    EXPECT_EQ(httpResponse.at(http::field::content_type), "application/json");
    EXPECT_EQ(httpResponse.body(), R"({"jsonrpc":"2.0","result":"0x0"})");
}

TEST_F(ResponseTest, GeneratedFollowsRequestVersionAndKeepAlive)
{
    auto const request = makeRequest(10, false);
    auto const httpResponse = Response{http::status::ok, "", request}.intoHttpResponse();
    EXPECT_EQ(httpResponse.version(), 10);
    EXPECT_FALSE(httpResponse.keep_alive());
}

TEST_F(ResponseTest, RelayedKeepsDestinationStatusAndHeaders)
{
    http::response<http::string_body> relayed{http::status::too_many_requests, 11};
    relayed.set(http::field::content_type, "application/json");
    relayed.set("X-RateLimit-Remaining", "0");
    relayed.body() = R"({"error":"slow down"})";
    relayed.prepare_payload();

    auto const request = makeRequest();
    Response response{std::move(relayed), request};

    EXPECT_TRUE(response.isRelayed());
    EXPECT_EQ(response.status(), http::status::too_many_requests);
    EXPECT_EQ(response.message(), R"({"error":"slow down"})");

    auto const httpResponse = std::move(response).intoHttpResponse();
    EXPECT_EQ(httpResponse.at("X-RateLimit-Remaining"), "0");
    EXPECT_EQ(httpResponse.at(http::field::content_type), "application/json");
    EXPECT_EQ(httpResponse.find(http::field::server), httpResponse.end());
}

TEST_F(ResponseTest, RelayedWithoutFramingGetsContentLength)
{
    http::response<http::string_body> relayed{http::status::ok, 11};
    relayed.body() = "0123456789";

    auto const request = makeRequest(10, false);
    auto const httpResponse = Response{std::move(relayed), request}.intoHttpResponse();

    EXPECT_EQ(httpResponse.at(http::field::content_length), "10");
    EXPECT_EQ(httpResponse.version(), 10);
    EXPECT_FALSE(httpResponse.keep_alive());
}

TEST_F(ResponseTest, RelayedChunkedBodyIsReframedForHttp10Client)
{
    http::response<http::string_body> relayed{http::status::ok, 11};
    relayed.set(http::field::content_type, "application/json");
    relayed.chunked(true);
    relayed.body() = R"({"result":"0x1"})";

    auto const request = makeRequest(10, false);
    auto const httpResponse = Response{std::move(relayed), request}.intoHttpResponse();

    EXPECT_FALSE(httpResponse.chunked());
    EXPECT_EQ(httpResponse.find(http::field::transfer_encoding), httpResponse.end());
    EXPECT_EQ(httpResponse.at(http::field::content_length), "16");
    EXPECT_EQ(httpResponse.version(), 10);
}

TEST_F(ResponseTest, RelayedContentLengthFollowsBody)
{
    http::response<http::string_body> relayed{http::status::ok, 11};
    relayed.content_length(100);
    relayed.body() = "short";

    auto const httpResponse = Response{std::move(relayed), makeRequest()}.intoHttpResponse();

    EXPECT_EQ(httpResponse.at(http::field::content_length), "5");
}

TEST_F(ResponseTest, RelayedNoContentKeepsNoBodyFraming)
{
    http::response<http::string_body> relayed{http::status::no_content, 11};
    relayed.chunked(true);

    auto const httpResponse = Response{std::move(relayed), makeRequest()}.intoHttpResponse();

    EXPECT_EQ(httpResponse.result(), http::status::no_content);
    EXPECT_EQ(httpResponse.find(http::field::transfer_encoding), httpResponse.end());
    EXPECT_EQ(httpResponse.find(http::field::content_length), httpResponse.end());
}

TEST_F(ResponseTest, ResponseWithoutRequestClosesConnection)
{
    Response response{http::status::payload_too_large, "Payload Too Large"};
    EXPECT_FALSE(response.isRelayed());

    auto const httpResponse = std::move(response).intoHttpResponse();
    EXPECT_EQ(httpResponse.result(), http::status::payload_too_large);
    EXPECT_EQ(httpResponse.version(), 11);
    EXPECT_FALSE(httpResponse.keep_alive());
    EXPECT_EQ(httpResponse.at(http::field::content_type), "text/plain");
    EXPECT_EQ(httpResponse.body(), "Payload Too Large");
}
