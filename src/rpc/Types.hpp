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

#include <variant>

namespace rpc {

/**
 * @brief Outcome of a rule: the (possibly) new value and whether it differs from the input
 */
template <typename T>
struct Rewritten {
    T value;
    bool modified = false;
};

/**
 * @brief Outcome of a request rule that answers the call itself; the destination is not contacted
 */
struct ShortCircuit {
    JsonRpcResponse response;
};

/**
 * @brief Outcome of running a request through the interceptor
 */
using Interception = std::variant<Rewritten<JsonRpcRequest>, ShortCircuit>;

}  // namespace rpc
