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

#include <boost/json/kind.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rpc {

namespace {

constexpr std::string_view JS_JSONRPC = "jsonrpc";
constexpr std::string_view JS_METHOD = "method";
constexpr std::string_view JS_PARAMS = "params";
constexpr std::string_view JS_ID = "id";
constexpr std::string_view JS_RESULT = "result";
constexpr std::string_view JS_ERROR = "error";

std::expected<boost::json::object, DecodeError>
parseObject(std::string_view body)
{
    boost::system::error_code ec;
    auto parsed = boost::json::parse(body, ec);
    if (ec)
        return std::unexpected{DecodeError{fmt::format("Malformed JSON: {}", ec.message())}};

    if (not parsed.is_object())
        return std::unexpected{DecodeError{"Not a JSON object"}};

    return std::move(parsed.as_object());
}

std::expected<std::string, DecodeError>
requiredString(boost::json::object const& object, std::string_view key)
{
    auto const* value = object.if_contains(key);
    if (value == nullptr)
        return std::unexpected{DecodeError{fmt::format("Missing '{}'", key)}};
    if (not value->is_string())
        return std::unexpected{DecodeError{fmt::format("'{}' is not a string", key)}};
    auto const& text = value->as_string();
    return std::string{text.data(), text.size()};
}

std::optional<boost::json::value>
optionalMember(boost::json::object const& object, std::string_view key)
{
    if (auto const* value = object.if_contains(key); value != nullptr)
        return *value;
    return std::nullopt;
}

boost::json::object
collectExtra(boost::json::object const& object, std::initializer_list<std::string_view> known)
{
    boost::json::object extra;
    for (auto const& [key, value] : object) {
        bool isKnown = false;
        for (auto const name : known)
            isKnown = isKnown or std::string_view{key.data(), key.size()} == name;

        if (not isKnown)
            extra.emplace(key, value);
    }
    return extra;
}

void
emplaceIfPresent(boost::json::object& object, std::string_view key, std::optional<boost::json::value> const& value)
{
    if (value.has_value())
        object.emplace(key, *value);
}

void
appendExtra(boost::json::object& object, boost::json::object const& extra)
{
    for (auto const& [key, value] : extra)
        object.emplace(key, value);
}

bool
isFinite(boost::json::value const& value);

bool
isFinite(boost::json::object const& object)
{
    return std::ranges::all_of(object, [](auto const& member) { return isFinite(member.value()); });
}

// NaN and infinities have no JSON representation
bool
isFinite(boost::json::value const& value)
{
    switch (value.kind()) {
        case boost::json::kind::double_:
            return std::isfinite(value.get_double());
        case boost::json::kind::array:
            return std::ranges::all_of(value.get_array(), [](auto const& item) { return isFinite(item); });
        case boost::json::kind::object:
            return isFinite(value.get_object());
        default:
            return true;
    }
}

std::expected<std::string, EncodeError>
serializeEnvelope(boost::json::object const& object, std::string_view what)
{
    if (not isFinite(object))
        return std::unexpected{EncodeError{fmt::format("Could not serialize {}: non-finite number", what)}};

    try {
        return boost::json::serialize(object);
    } catch (std::exception const& e) {
        return std::unexpected{EncodeError{fmt::format("Could not serialize {}: {}", what, e.what())}};
    }
}

}  // namespace

std::expected<JsonRpcRequest, DecodeError>
decodeRequest(std::string_view body)
{
    auto const object = parseObject(body);
    if (not object.has_value())
        return std::unexpected{object.error()};

    auto jsonrpc = requiredString(*object, JS_JSONRPC);
    if (not jsonrpc.has_value())
        return std::unexpected{std::move(jsonrpc).error()};

    auto method = requiredString(*object, JS_METHOD);
    if (not method.has_value())
        return std::unexpected{std::move(method).error()};

    return JsonRpcRequest{
        .jsonrpc = std::move(jsonrpc).value(),
        .method = std::move(method).value(),
        .params = optionalMember(*object, JS_PARAMS),
        .id = optionalMember(*object, JS_ID),
        .extra = collectExtra(*object, {JS_JSONRPC, JS_METHOD, JS_PARAMS, JS_ID}),
    };
}

std::expected<JsonRpcResponse, DecodeError>
decodeResponse(std::string_view body)
{
    auto const object = parseObject(body);
    if (not object.has_value())
        return std::unexpected{object.error()};

    auto jsonrpc = requiredString(*object, JS_JSONRPC);
    if (not jsonrpc.has_value())
        return std::unexpected{std::move(jsonrpc).error()};

    return JsonRpcResponse{
        .jsonrpc = std::move(jsonrpc).value(),
        .result = optionalMember(*object, JS_RESULT),
        .error = optionalMember(*object, JS_ERROR),
        .id = optionalMember(*object, JS_ID),
        .extra = collectExtra(*object, {JS_JSONRPC, JS_RESULT, JS_ERROR, JS_ID}),
    };
}

std::expected<std::string, EncodeError>
encode(JsonRpcRequest const& request)
{
    boost::json::object object;
    object.emplace(JS_JSONRPC, request.jsonrpc);
    object.emplace(JS_METHOD, request.method);
    emplaceIfPresent(object, JS_PARAMS, request.params);
    emplaceIfPresent(object, JS_ID, request.id);
    appendExtra(object, request.extra);
    return serializeEnvelope(object, "request");
}

std::expected<std::string, EncodeError>
encode(JsonRpcResponse const& response)
{
    boost::json::object object;
    object.emplace(JS_JSONRPC, response.jsonrpc);
    emplaceIfPresent(object, JS_RESULT, response.result);
    emplaceIfPresent(object, JS_ERROR, response.error);
    emplaceIfPresent(object, JS_ID, response.id);
    appendExtra(object, response.extra);
    return serializeEnvelope(object, "response");
}

}  // namespace rpc
