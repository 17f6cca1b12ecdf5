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

#pragma once

#include "rpc/JsonRpc.hpp"
#include "rpc/RewriteObserver.hpp"
#include "rpc/Types.hpp"
#include "util/StringHash.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rpc {

/**
 * @brief Rewrites destination responses, dispatching on the method of the request that produced them.
 */
class ResponseEnhancer {
public:
    using ResponseRule = std::function<Rewritten<JsonRpcResponse>(JsonRpcResponse const&)>;

private:
    std::unordered_map<std::string, ResponseRule, util::StringHash, std::equal_to<>> ruleMap_;

public:
    /**
     * @brief Construct an enhancer with the default `stateRoot` rule for both block queries
     */
    ResponseEnhancer();

    /**
     * @brief Register a rule, replacing any rule already registered for the method
     *
     * @param method The request method the rule applies to
     * @param rule The rule
     */
    void
    addRule(std::string method, ResponseRule rule);

    /**
     * @brief Whether a rule is registered for the method
     *
     * @param method The method name
     * @return true if a rule is registered
     */
    [[nodiscard]] bool
    contains(std::string_view method) const;

    /**
     * @brief Run a decoded response through the rule registered for the method, if any
     *
     * @param method The method of the original request
     * @param response The decoded response
     * @param observer Notified when the rule changed the response
     * @return The possibly rewritten response
     */
    [[nodiscard]] Rewritten<JsonRpcResponse>
    apply(std::string_view method, JsonRpcResponse const& response, RewriteObserver const& observer) const;

    /**
     * @brief Rewrite a raw response body.
     *
     * Bodies that are not JSON-RPC responses, and methods without a rule, are not an error: the original bytes are
     * to be used as they are.
     *
     * @param method The method of the original request
     * @param body The raw response body
     * @param observer Notified when the rule changed the response
     * @return The new body, std::nullopt if the original body stays, or an error if the rewritten response could not
     * be serialized
     */
    [[nodiscard]] std::expected<std::optional<std::string>, EncodeError>
    enhance(std::string_view method, std::string_view body, RewriteObserver const& observer) const;
};

}  // namespace rpc
