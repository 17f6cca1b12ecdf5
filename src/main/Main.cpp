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

#include "app/CliArgs.hpp"
#include "app/ProxyApplication.hpp"
#include "util/OverloadSet.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/value_from.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>

namespace {

int
runProxy(app::CliArgs::Run const& run)
{
    util::Config config;
    if (run.configPath.has_value()) {
        auto loaded = util::ConfigReader::open(*run.configPath);
        if (not loaded.has_value()) {
            std::cerr << loaded.error() << std::endl;
            return EXIT_FAILURE;
        }
        config = std::move(loaded).value();
    }

    if (run.port.has_value())
        config.set("server.port", boost::json::value_from(*run.port));
    if (run.destination.has_value())
        config.set("destination.url", boost::json::value_from(*run.destination));

    util::LogService::init(config);
    app::ProxyApplication proxy{config};
    return proxy.run();
}

}  // namespace

int
main(int argc, char const* argv[])
try {
    return std::visit(
        util::OverloadSet{
            [](app::CliArgs::Exit const& exit) { return exit.exitCode; },
            [](app::CliArgs::Run const& run) { return runProxy(run); }
        },
        app::CliArgs::parse(argc, argv)
    );
} catch (std::exception const& e) {
    LOG(util::LogService::fatal()) << "Exit on exception: " << e.what();
    return EXIT_FAILURE;
} catch (...) {
    LOG(util::LogService::fatal()) << "Exit on exception: unknown";
    return EXIT_FAILURE;
}
