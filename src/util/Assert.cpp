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

#include "util/Assert.hpp"

#include "util/log/Logger.hpp"

#include <boost/log/core/core.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/core.h>

#include <cstdlib>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>

namespace util::impl {

void
onAssertionFailure(std::source_location const& location, std::string_view expression, std::string const& message)
{
    auto const trace = boost::stacktrace::stacktrace{};
    auto const report = fmt::format(
        "{}:{}: invariant '{}' does not hold: {}\n{}",
        location.file_name(),
        location.line(),
        expression,
        message,
        boost::stacktrace::to_string(trace)
    );

    if (auto const core = boost::log::core::get(); core->get_logging_enabled()) {
        LOG(LogService::fatal()) << report;
    } else {
        std::cerr << report << '\n' << std::flush;
    }
    std::exit(EXIT_FAILURE);
}

}  // namespace util::impl
