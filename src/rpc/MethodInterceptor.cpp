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

#include "rpc/MethodInterceptor.hpp"

#include "rpc/JsonRpc.hpp"
#include "rpc/RewriteObserver.hpp"
#include "rpc/Types.hpp"
#include "rpc/rules/CallObject.hpp"
#include "rpc/rules/TransactionCount.hpp"
#include "util/OverloadSet.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace rpc {

MethodInterceptor::MethodInterceptor()
    : ruleMap_{
          {std::string{rules::TransactionCount::METHOD}, rules::TransactionCount{}},
          {std::string{rules::CallObject::METHOD}, rules::CallObject{}},
      }
{
}

void
MethodInterceptor::addRule(std::string method, RequestRule rule)
{
    ruleMap_.insert_or_assign(std::move(method), std::move(rule));
}

bool
MethodInterceptor::contains(std::string_view method) const
{
    return ruleMap_.find(method) != ruleMap_.end();
}

Interception
MethodInterceptor::intercept(JsonRpcRequest const& request, RewriteObserver const& observer) const
{
    auto const it = ruleMap_.find(request.method);
    if (it == ruleMap_.end())
        return Rewritten<JsonRpcRequest>{request, false};

    auto result = it->second(request);
    std::visit(
        util::OverloadSet{
            [&](Rewritten<JsonRpcRequest> const& rewritten) {
                if (rewritten.modified)
                    observer.onRequestRewritten(request.method);
            },
            [&](ShortCircuit const&) { observer.onShortCircuit(request.method); },
        },
        result
    );
    return result;
}

}  // namespace rpc
