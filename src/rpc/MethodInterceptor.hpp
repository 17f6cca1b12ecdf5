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

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rpc {

/**
 * @brief Rewrites or answers requests before they are forwarded, dispatching on the exact method name.
 */
class MethodInterceptor {
public:
    using RequestRule = std::function<Interception(JsonRpcRequest const&)>;

private:
    std::unordered_map<std::string, RequestRule, util::StringHash, std::equal_to<>> ruleMap_;

public:
    /**
     * @brief Construct an interceptor with the default rules for `eth_getTransactionCount` and `eth_call`
     */
    MethodInterceptor();

    /**
     * @brief Register a rule, replacing any rule already registered for the method
     *
     * @param method The method name the rule applies to
     * @param rule The rule
     */
    void
    addRule(std::string method, RequestRule rule);

    /**
     * @brief Whether a rule is registered for the method
     *
     * @param method The method name
     * @return true if a rule is registered
     */
    [[nodiscard]] bool
    contains(std::string_view method) const;

    /**
     * @brief Run the request through the rule registered for its method, if any
     *
     * @param request The decoded request
     * @param observer Notified when the rule changed or answered the request
     * @return The request to forward, or the response to return without contacting the destination
     */
    [[nodiscard]] Interception
    intercept(JsonRpcRequest const& request, RewriteObserver const& observer) const;
};

}  // namespace rpc
