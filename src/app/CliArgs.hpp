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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace app {

/**
 * @brief Command line of the proxy executable.
 */
class CliArgs {
public:
    /** Start the proxy. Options that are set take precedence over the configuration file. */
    struct Run {
        std::optional<std::string> configPath;
        std::optional<std::uint16_t> port;
        std::optional<std::string> destination;
    };

    /** Terminate without starting, e.g. after printing help or a usage error. */
    struct Exit {
        int exitCode;
    };

    using Action = std::variant<Run, Exit>;

    /**
     * @brief Parse the arguments given to main.
     *
     * Usage errors are printed to stderr and turn into an Exit with EXIT_FAILURE.
     */
    static Action
    parse(int argc, char const* argv[]);
};

}  // namespace app
