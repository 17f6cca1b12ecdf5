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

#include "rpc/rules/StateRoot.hpp"

#include "rpc/JsonRpc.hpp"
#include "rpc/Types.hpp"

#include <boost/json/object.hpp>
#include <boost/json/string.hpp>
#include <boost/json/value.hpp>

#include <string_view>
#include <utility>

namespace rpc::rules {

namespace {

constexpr std::string_view JS_STATE_ROOT = "stateRoot";

bool
needsFix(boost::json::object const& block)
{
    auto const* stateRoot = block.if_contains(JS_STATE_ROOT);
    if (stateRoot == nullptr or not stateRoot->is_string())
        return true;

    auto const& value = stateRoot->as_string();
    return value == "0x" or value.size() != StateRoot::HASH_LENGTH;
}

}  // namespace

Rewritten<JsonRpcResponse>
StateRoot::operator()(JsonRpcResponse const& response) const
{
    if (not response.result.has_value() or not response.result->is_object())
        return {response, false};

    if (not needsFix(response.result->as_object()))
        return {response, false};

    auto fixed = response;
    // replaces the value in place or appends the member when it was missing
    fixed.result->as_object()[JS_STATE_ROOT] = boost::json::string(PLACEHOLDER.data(), PLACEHOLDER.size());

    return {std::move(fixed), true};
}

}  // namespace rpc::rules
