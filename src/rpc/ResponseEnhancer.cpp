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

#include "rpc/ResponseEnhancer.hpp"

#include "rpc/JsonRpc.hpp"
#include "rpc/RewriteObserver.hpp"
#include "rpc/Types.hpp"
#include "rpc/rules/StateRoot.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rpc {

ResponseEnhancer::ResponseEnhancer()
    : ruleMap_{
          {std::string{rules::StateRoot::BLOCK_BY_NUMBER}, rules::StateRoot{}},
          {std::string{rules::StateRoot::BLOCK_BY_HASH}, rules::StateRoot{}},
      }
{
}

void
ResponseEnhancer::addRule(std::string method, ResponseRule rule)
{
    ruleMap_.insert_or_assign(std::move(method), std::move(rule));
}

bool
ResponseEnhancer::contains(std::string_view method) const
{
    return ruleMap_.find(method) != ruleMap_.end();
}

Rewritten<JsonRpcResponse>
ResponseEnhancer::apply(std::string_view method, JsonRpcResponse const& response, RewriteObserver const& observer)
    const
{
    auto const it = ruleMap_.find(method);
    if (it == ruleMap_.end())
        return {response, false};

    auto result = it->second(response);
    if (result.modified)
        observer.onResponseRewritten(method);
    return result;
}

std::expected<std::optional<std::string>, EncodeError>
ResponseEnhancer::enhance(std::string_view method, std::string_view body, RewriteObserver const& observer) const
{
    // checked first so that responses to other methods are never parsed
    if (not contains(method))
        return std::nullopt;

    auto const response = decodeResponse(body);
    if (not response.has_value())
        return std::nullopt;

    auto const result = apply(method, *response, observer);
    if (not result.modified)
        return std::nullopt;

    auto encoded = encode(result.value);
    if (not encoded.has_value())
        return std::unexpected{std::move(encoded).error()};

    return std::make_optional(std::move(encoded).value());
}

}  // namespace rpc
