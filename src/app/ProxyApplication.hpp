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

#include "util/config/Config.hpp"

namespace app {

/**
 * @brief Wires the destination client, the forwarding pipeline and the web server together and runs them.
 */
class ProxyApplication {
    util::Config const& config_;

public:
    static constexpr unsigned int kDEFAULT_IO_THREADS = 2;

    /**
     * @param config Configuration with command line overrides already applied
     */
    explicit ProxyApplication(util::Config const& config);

    /**
     * @brief Serve until SIGINT or SIGTERM arrives.
     *
     * @return The process exit code
     */
    int
    run();
};

}  // namespace app
