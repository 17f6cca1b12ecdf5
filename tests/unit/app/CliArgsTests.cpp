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
#include "util/NameGenerator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using app::CliArgs;

namespace {

CliArgs::Action
parseArgs(std::vector<char const*> argv)
{
    argv.insert(argv.begin(), "tronbridge");
    return CliArgs::parse(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliArgsTest, NoArgumentsRunWithoutOverrides)
{
    auto const action = parseArgs({});
    auto const* run = std::get_if<CliArgs::Run>(&action);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->configPath, std::nullopt);
    EXPECT_EQ(run->port, std::nullopt);
    EXPECT_EQ(run->destination, std::nullopt);
}

TEST(CliArgsTest, LongOptionsAreCollected)
{
    auto const action =
        parseArgs({"--conf", "/etc/tronbridge.json", "--port", "8545", "--dest", "https://api.shasta.trongrid.io/jsonrpc"});
    auto const* run = std::get_if<CliArgs::Run>(&action);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->configPath, "/etc/tronbridge.json");
    EXPECT_EQ(run->port, std::optional<std::uint16_t>{8545});
    EXPECT_EQ(run->destination, "https://api.shasta.trongrid.io/jsonrpc");
}

TEST(CliArgsTest, ShortOptionsAreCollected)
{
    auto const action = parseArgs({"-d", "http://127.0.0.1:8090", "-p", "65535", "-c", "config.json"});
    auto const* run = std::get_if<CliArgs::Run>(&action);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->configPath, "config.json");
    EXPECT_EQ(run->port, std::optional<std::uint16_t>{65535});
    EXPECT_EQ(run->destination, "http://127.0.0.1:8090");
}

struct CliArgsExitBundle {
    std::string testName;
    std::vector<char const*> argv;
    int exitCode;
};

struct CliArgsExitTest : testing::TestWithParam<CliArgsExitBundle> {};

INSTANTIATE_TEST_CASE_P(
    CliArgsExits,
    CliArgsExitTest,
    testing::Values(
        CliArgsExitBundle{"Version", {"--version"}, EXIT_SUCCESS},
        CliArgsExitBundle{"VersionShort", {"-v"}, EXIT_SUCCESS},
        CliArgsExitBundle{"Help", {"--help"}, EXIT_SUCCESS},
        CliArgsExitBundle{"HelpWinsOverRunOptions", {"-p", "8545", "-h"}, EXIT_SUCCESS},
        CliArgsExitBundle{"PortZero", {"--port", "0"}, EXIT_FAILURE},
        CliArgsExitBundle{"PortTooLarge", {"--port", "65536"}, EXIT_FAILURE},
        CliArgsExitBundle{"NegativePort", {"--port", "-1"}, EXIT_FAILURE},
        CliArgsExitBundle{"PortNotNumber", {"--port", "abc"}, EXIT_FAILURE},
        CliArgsExitBundle{"UnknownOption", {"--unknown", "x"}, EXIT_FAILURE},
        CliArgsExitBundle{"MissingValue", {"--dest"}, EXIT_FAILURE}
    ),
    tests::util::NameGenerator
);

TEST_P(CliArgsExitTest, ExitsWithCode)
{
    auto const action = parseArgs(GetParam().argv);
    auto const* exit = std::get_if<CliArgs::Exit>(&action);
    ASSERT_NE(exit, nullptr);
    EXPECT_EQ(exit->exitCode, GetParam().exitCode);
}
