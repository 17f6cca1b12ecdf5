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

#include "util/build/Build.hpp"

#include <boost/program_options/errors.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace app {

CliArgs::Action
CliArgs::parse(int argc, char const* argv[])
{
    namespace po = boost::program_options;
    // clang-format off
    po::options_description description("Options");
    description.add_options()
        ("help,h", "print help message and exit")
        ("version,v", "print version and exit")
        ("conf,c", po::value<std::string>(), "configuration file")
        ("port,p", po::value<int>(), "port to listen on, overrides server.port")
        ("dest,d", po::value<std::string>(), "destination URL, overrides destination.url")
    ;
    // clang-format on

    po::variables_map parsed;
    try {
        po::store(po::command_line_parser(argc, argv).options(description).run(), parsed);
        po::notify(parsed);
    } catch (po::error const& e) {
        std::cerr << e.what() << "\n\n" << description;
        return Exit{EXIT_FAILURE};
    }

    if (parsed.count("version") != 0u) {
        std::cout << util::build::getTronbridgeFullVersionString() << '\n';
        return Exit{EXIT_SUCCESS};
    }

    if (parsed.count("help") != 0u) {
        std::cout << "JSON-RPC proxy " << util::build::getTronbridgeFullVersionString() << "\n\n" << description;
        return Exit{EXIT_SUCCESS};
    }

    Run run;
    if (parsed.count("conf") != 0u)
        run.configPath = parsed["conf"].as<std::string>();

    if (parsed.count("port") != 0u) {
        auto const port = parsed["port"].as<int>();
        if (port <= 0 or port > std::numeric_limits<std::uint16_t>::max()) {
            std::cerr << "Invalid port: " << port << "\n\n" << description;
            return Exit{EXIT_FAILURE};
        }
        run.port = static_cast<std::uint16_t>(port);
    }

    if (parsed.count("dest") != 0u)
        run.destination = parsed["dest"].as<std::string>();

    return run;
}

}  // namespace app
