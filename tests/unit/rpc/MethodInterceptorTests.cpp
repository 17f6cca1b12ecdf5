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

#include "rpc/JsonRpc.hpp"
#include "rpc/MethodInterceptor.hpp"
#include "rpc/MockRewriteObserver.hpp"
#include "rpc/Types.hpp"
#include "rpc/rules/CallObject.hpp"
#include "rpc/rules/TransactionCount.hpp"
#include "util/NameGenerator.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>

using namespace rpc;

namespace {

JsonRpcRequest
makeRequest(std::string const& body)
{
    auto request = decodeRequest(body);
    EXPECT_TRUE(request.has_value());
    return request.value_or(JsonRpcRequest{});
}

}  // namespace

struct MethodInterceptorTest : testing::Test {
    MethodInterceptor interceptor;
    StrictMockRewriteObserver observer;
};

TEST_F(MethodInterceptorTest, DefaultRules)
{
    EXPECT_TRUE(interceptor.contains(rules::TransactionCount::METHOD));
    EXPECT_TRUE(interceptor.contains(rules::CallObject::METHOD));
    EXPECT_FALSE(interceptor.contains("eth_getBalance"));
    EXPECT_FALSE(interceptor.contains("ETH_CALL"));
}

TEST_F(MethodInterceptorTest, TransactionCountIsAnsweredLocally)
{
    auto const request = makeRequest(
        R"({"jsonrpc":"2.0","method":"eth_getTransactionCount","params":["0xabc","latest"],"id":1})"
    );

    EXPECT_CALL(observer, onShortCircuit(testing::Eq("eth_getTransactionCount")));
    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<ShortCircuit>(result));
    auto const encoded = encode(std::get<ShortCircuit>(result).response);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded, R"({"jsonrpc":"2.0","result":"0x0","id":1})");
}

TEST_F(MethodInterceptorTest, TransactionCountEchoesStringId)
{
    auto const request = makeRequest(R"({"jsonrpc":"2.0","method":"eth_getTransactionCount","id":"abc"})");

    EXPECT_CALL(observer, onShortCircuit);
    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<ShortCircuit>(result));
    auto const& response = std::get<ShortCircuit>(result).response;
    ASSERT_TRUE(response.id.has_value());
    EXPECT_EQ(*response.id, boost::json::value("abc"));
    ASSERT_TRUE(response.result.has_value());
    EXPECT_EQ(*response.result, boost::json::value(rules::TransactionCount::NONCE));
    EXPECT_FALSE(response.error.has_value());
}

TEST_F(MethodInterceptorTest, TransactionCountWithoutIdRepliesWithNullId)
{
    auto const request = makeRequest(R"({"jsonrpc":"2.0","method":"eth_getTransactionCount","params":[]})");

    EXPECT_CALL(observer, onShortCircuit);
    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<ShortCircuit>(result));
    auto const encoded = encode(std::get<ShortCircuit>(result).response);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded, R"({"jsonrpc":"2.0","result":"0x0","id":null})");
}

TEST_F(MethodInterceptorTest, MethodWithoutRuleIsUnchanged)
{
    auto const request = makeRequest(R"({"jsonrpc":"2.0","method":"eth_getBalance","params":["0x1"],"id":3})");

    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(result));
    auto const& rewritten = std::get<Rewritten<JsonRpcRequest>>(result);
    EXPECT_FALSE(rewritten.modified);
    EXPECT_EQ(rewritten.value, request);
}

TEST_F(MethodInterceptorTest, MethodNamesAreCaseSensitive)
{
    auto const request = makeRequest(R"({"jsonrpc":"2.0","method":"eth_gettransactioncount","id":3})");

    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(result));
    EXPECT_FALSE(std::get<Rewritten<JsonRpcRequest>>(result).modified);
}

TEST_F(MethodInterceptorTest, AddRuleReplacesExistingRule)
{
    interceptor.addRule(std::string{rules::TransactionCount::METHOD}, [](JsonRpcRequest const& request) {
        return Interception{Rewritten<JsonRpcRequest>{request, false}};
    });
    auto const request = makeRequest(R"({"jsonrpc":"2.0","method":"eth_getTransactionCount","id":1})");

    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(result));
    EXPECT_FALSE(std::get<Rewritten<JsonRpcRequest>>(result).modified);
}

TEST_F(MethodInterceptorTest, AddRuleForNewMethod)
{
    interceptor.addRule("eth_chainId", [](JsonRpcRequest const& request) {
        auto changed = request;
        changed.params = boost::json::parse("[]");
        return Interception{Rewritten<JsonRpcRequest>{std::move(changed), true}};
    });
    auto const request = makeRequest(R"({"jsonrpc":"2.0","method":"eth_chainId","id":1})");

    EXPECT_TRUE(interceptor.contains("eth_chainId"));
    EXPECT_CALL(observer, onRequestRewritten(testing::Eq("eth_chainId")));
    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(result));
    auto const& rewritten = std::get<Rewritten<JsonRpcRequest>>(result);
    EXPECT_TRUE(rewritten.modified);
    ASSERT_TRUE(rewritten.value.params.has_value());
    EXPECT_EQ(*rewritten.value.params, boost::json::parse("[]"));
}

struct CallObjectTestBundle {
    std::string testName;
    std::optional<std::string> params;
    std::optional<std::string> expectedParams;  // nullopt means unchanged
};

struct CallObjectTest : MethodInterceptorTest, testing::WithParamInterface<CallObjectTestBundle> {};

TEST_P(CallObjectTest, Intercept)
{
    auto const& bundle = GetParam();
    std::string body = R"({"jsonrpc":"2.0","method":"eth_call",)";
    if (bundle.params)
        body += R"("params":)" + *bundle.params + ",";
    body += R"("id":9})";
    auto const request = makeRequest(body);

    if (bundle.expectedParams)
        EXPECT_CALL(observer, onRequestRewritten(testing::Eq("eth_call")));

    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(result));
    auto const& rewritten = std::get<Rewritten<JsonRpcRequest>>(result);
    if (bundle.expectedParams) {
        EXPECT_TRUE(rewritten.modified);
        ASSERT_TRUE(rewritten.value.params.has_value());
        EXPECT_EQ(boost::json::serialize(*rewritten.value.params), *bundle.expectedParams);
        EXPECT_EQ(rewritten.value.id, request.id);
        EXPECT_EQ(rewritten.value.method, request.method);
    } else {
        EXPECT_FALSE(rewritten.modified);
        EXPECT_EQ(rewritten.value, request);
    }
}

INSTANTIATE_TEST_CASE_P(
    MethodInterceptorTests,
    CallObjectTest,
    testing::Values(
        CallObjectTestBundle{
            "InputRenamedAndChainIdDropped",
            R"([{"to":"0x1","input":"0xabc","chainId":"0x2b6"},"latest"])",
            R"([{"to":"0x1","data":"0xabc"},"latest"])"
        },
        CallObjectTestBundle{
            "InputKeepsItsPosition",
            R"([{"from":"0x2","input":"0xabc","to":"0x1"}])",
            R"([{"from":"0x2","data":"0xabc","to":"0x1"}])"
        },
        CallObjectTestBundle{
            "DataWinsOverInput",
            R"([{"to":"0x1","input":"0xabc","data":"0xdef"}])",
            R"([{"to":"0x1","data":"0xdef"}])"
        },
        CallObjectTestBundle{
            "DataBeforeInput",
            R"([{"data":"0xdef","input":"0xabc"}])",
            R"([{"data":"0xdef"}])"
        },
        CallObjectTestBundle{"OnlyChainId", R"([{"chainId":"0x1"},"latest"])", R"([{},"latest"])"},
        CallObjectTestBundle{"AlreadyNormalized", R"([{"to":"0x1","data":"0xdef"}])", std::nullopt},
        CallObjectTestBundle{"ParamsIsObject", R"({"input":"0xabc"})", std::nullopt},
        CallObjectTestBundle{"FirstParamNotObject", R"(["latest",{"input":"0x1"}])", std::nullopt},
        CallObjectTestBundle{"EmptyParams", "[]", std::nullopt},
        CallObjectTestBundle{"NullParams", "null", std::nullopt},
        CallObjectTestBundle{"NoParams", std::nullopt, std::nullopt}
    ),
    tests::util::NameGenerator
);

TEST_F(MethodInterceptorTest, CallObjectIsIdempotent)
{
    auto const request =
        makeRequest(R"({"jsonrpc":"2.0","method":"eth_call","params":[{"input":"0x1","chainId":"0x2"}],"id":1})");

    EXPECT_CALL(observer, onRequestRewritten).Times(1);
    auto const first = interceptor.intercept(request, observer);
    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(first));
    auto const& once = std::get<Rewritten<JsonRpcRequest>>(first);
    ASSERT_TRUE(once.modified);

    auto const second = interceptor.intercept(once.value, observer);
    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(second));
    auto const& twice = std::get<Rewritten<JsonRpcRequest>>(second);
    EXPECT_FALSE(twice.modified);
    EXPECT_EQ(twice.value, once.value);
}

TEST_F(MethodInterceptorTest, CallObjectKeepsExtraMembers)
{
    auto const request =
        makeRequest(R"({"jsonrpc":"2.0","method":"eth_call","params":[{"input":"0x1"}],"id":1,"trace":true})");

    EXPECT_CALL(observer, onRequestRewritten);
    auto const result = interceptor.intercept(request, observer);

    ASSERT_TRUE(std::holds_alternative<Rewritten<JsonRpcRequest>>(result));
    auto const encoded = encode(std::get<Rewritten<JsonRpcRequest>>(result).value);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded, R"({"jsonrpc":"2.0","method":"eth_call","params":[{"data":"0x1"}],"id":1,"trace":true})");
}
