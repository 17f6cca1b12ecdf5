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
#include "rpc/Types.hpp"

#include <string_view>

namespace rpc::rules {

/**
 * @brief Answers `eth_getTransactionCount` with a constant nonce of zero.
 *
 * The destination does not keep account nonces usable by the client, so the call is never forwarded. The reply
 * echoes the request id, or carries a null id when the request had none.
 */
struct TransactionCount {
    static constexpr std::string_view METHOD = "eth_getTransactionCount";
    static constexpr char const* NONCE = "0x0";

    Interception
    operator()(JsonRpcRequest const& request) const;
};

}  // namespace rpc::rules
