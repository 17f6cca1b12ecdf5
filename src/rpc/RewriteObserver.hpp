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

#include "util/log/Logger.hpp"

#include <string_view>

namespace rpc {

/**
 * @brief Receives notifications about what the rewrite rules did to a call.
 */
class RewriteObserver {
public:
    virtual ~RewriteObserver() = default;

    /**
     * @brief A request rule changed the request before it was forwarded
     *
     * @param method The method of the request
     */
    virtual void
    onRequestRewritten(std::string_view method) const = 0;

    /**
     * @brief A request rule answered the call without contacting the destination
     *
     * @param method The method of the request
     */
    virtual void
    onShortCircuit(std::string_view method) const = 0;

    /**
     * @brief A response rule changed the destination's response
     *
     * @param method The method of the original request
     */
    virtual void
    onResponseRewritten(std::string_view method) const = 0;
};

/**
 * @brief Observer that reports rewrites to the RPC log channel.
 */
class LoggingRewriteObserver : public RewriteObserver {
    util::Logger log_{"RPC"};

public:
    void
    onRequestRewritten(std::string_view method) const override;

    void
    onShortCircuit(std::string_view method) const override;

    void
    onResponseRewritten(std::string_view method) const override;
};

}  // namespace rpc
