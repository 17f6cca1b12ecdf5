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
 * @brief Normalizes the call object of an `eth_call` request.
 *
 * Only applies when `params` is an array whose first element is an object:
 *  - `input` is dropped when `data` is also present, otherwise it is renamed to `data` keeping its position;
 *  - `chainId` is always dropped.
 * Any other shape is left as is.
 */
struct CallObject {
    static constexpr std::string_view METHOD = "eth_call";

    Interception
    operator()(JsonRpcRequest const& request) const;
};

}  // namespace rpc::rules
