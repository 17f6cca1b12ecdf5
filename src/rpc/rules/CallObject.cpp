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

#include "rpc/rules/CallObject.hpp"

#include "rpc/JsonRpc.hpp"
#include "rpc/Types.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <string_view>
#include <utility>

namespace rpc::rules {

namespace {

constexpr std::string_view JS_INPUT = "input";
constexpr std::string_view JS_DATA = "data";
constexpr std::string_view JS_CHAIN_ID = "chainId";

}  // namespace

Interception
CallObject::operator()(JsonRpcRequest const& request) const
{
    if (not request.params.has_value() or not request.params->is_array())
        return Rewritten<JsonRpcRequest>{request, false};

    auto const& params = request.params->as_array();
    if (params.empty() or not params.front().is_object())
        return Rewritten<JsonRpcRequest>{request, false};

    auto const& call = params.front().as_object();
    auto const hasInput = call.contains(JS_INPUT);
    auto const hasData = call.contains(JS_DATA);
    if (not hasInput and not call.contains(JS_CHAIN_ID))
        return Rewritten<JsonRpcRequest>{request, false};

    // rebuilt member by member so that everything else keeps its position
    boost::json::object normalized;
    normalized.reserve(call.size());
    for (auto const& [key, value] : call) {
        std::string_view const name{key.data(), key.size()};
        if (name == JS_CHAIN_ID)
            continue;

        if (name == JS_INPUT) {
            if (not hasData)
                normalized.emplace(JS_DATA, value);
            continue;
        }

        normalized.emplace(key, value);
    }

    auto rewritten = request;
    auto& rewrittenParams = rewritten.params->as_array();
    rewrittenParams.front() = std::move(normalized);

    return Rewritten<JsonRpcRequest>{std::move(rewritten), true};
}

}  // namespace rpc::rules
