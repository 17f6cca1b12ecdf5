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

#include <fmt/core.h>

#include <source_location>
#include <string>
#include <string_view>

namespace util::impl {

/**
 * @brief Report a violated invariant with a stack trace and terminate the process.
 *
 * Goes to the `General` log channel when logging is enabled, to stderr otherwise.
 */
[[noreturn]] void
onAssertionFailure(std::source_location const& location, std::string_view expression, std::string const& message);

}  // namespace util::impl

/**
 * @brief Check a programming invariant; the message arguments are only formatted when it does not hold.
 */
#define ASSERT(condition, ...)                                                                                  \
    do {                                                                                                        \
        if (not(condition))                                                                                     \
            util::impl::onAssertionFailure(std::source_location::current(), #condition, fmt::format(__VA_ARGS__)); \
    } while (false)
