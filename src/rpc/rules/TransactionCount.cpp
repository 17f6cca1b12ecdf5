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

#include "rpc/rules/TransactionCount.hpp"

#include "rpc/JsonRpc.hpp"
#include "rpc/Types.hpp"

#include <boost/json/value.hpp>

#include <optional>

namespace rpc::rules {

Interception
TransactionCount::operator()(JsonRpcRequest const& request) const
{
    return ShortCircuit{JsonRpcResponse{
        .jsonrpc = "2.0",
        .result = boost::json::value(NONCE),
        .error = std::nullopt,
        .id = request.id.value_or(boost::json::value(nullptr)),
        .extra = {},
    }};
}

}  // namespace rpc::rules
