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

#include <cstddef>
#include <string_view>

namespace rpc::rules {

/**
 * @brief Repairs the `stateRoot` of block objects returned by `eth_getBlockByNumber` and `eth_getBlockByHash`.
 *
 * A `stateRoot` that is missing, not a string, `"0x"` or not exactly 66 characters long is replaced with a fixed
 * placeholder hash. Responses without an object `result` are left as is and `error` is never touched.
 */
struct StateRoot {
    static constexpr std::string_view BLOCK_BY_NUMBER = "eth_getBlockByNumber";
    static constexpr std::string_view BLOCK_BY_HASH = "eth_getBlockByHash";
    static constexpr std::string_view PLACEHOLDER = "0x0101010101010101010101010101010101010101010101010101010101010101";
    static constexpr std::size_t HASH_LENGTH = 66;

    Rewritten<JsonRpcResponse>
    operator()(JsonRpcResponse const& response) const;
};

}  // namespace rpc::rules
