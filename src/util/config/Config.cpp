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

#include "util/config/Config.hpp"

#include "util/config/impl/Helpers.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <expected>
#include <filesystem>
#include <fstream>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

namespace impl {

std::vector<std::string_view>
splitKey(std::string_view key)
{
    std::vector<std::string_view> parts;
    while (true) {
        auto const dot = key.find('.');
        auto const part = key.substr(0, dot);
        if (part.empty())
            throw std::runtime_error(fmt::format("Malformed configuration key '{}'", key));

        parts.push_back(part);
        if (dot == std::string_view::npos)
            return parts;
        key.remove_prefix(dot + 1);
    }
}

std::string
describeBadValue(std::string_view key, std::string_view reason)
{
    return fmt::format("Bad value for configuration key '{}': {}", key, reason);
}

}  // namespace impl

// parentheses, not braces: a braced value would become a one element array
Config::Config(boost::json::value store) : store_(std::move(store))
{
}

boost::json::value const*
Config::find(std::string_view key) const
{
    boost::json::value const* current = &store_;
    for (auto const part : impl::splitKey(key)) {
        if (current->is_null())
            return nullptr;
        if (not current->is_object())
            throw std::runtime_error(fmt::format("Configuration key '{}' runs through a non-object value", key));

        current = current->as_object().if_contains(part);
        if (current == nullptr)
            return nullptr;
    }
    return current;
}

std::vector<Config>
Config::arrayOr(std::string_view key, std::vector<Config> fallback) const
{
    auto const* element = find(key);
    if (element == nullptr)
        return fallback;
    if (not element->is_array())
        throw std::runtime_error(impl::describeBadValue(key, "expected an array"));

    std::vector<Config> out;
    out.reserve(element->as_array().size());
    for (auto const& item : element->as_array())
        out.emplace_back(item);
    return out;
}

Config
Config::sectionOr(std::string_view key, boost::json::object fallback) const
{
    auto const* element = find(key);
    if (element != nullptr and element->is_object())
        return Config{*element};
    return Config{std::move(fallback)};
}

void
Config::set(std::string_view key, boost::json::value value)
{
    auto const parts = impl::splitKey(key);
    boost::json::value* current = &store_;

    for (auto const part : parts) {
        if (current->is_null())
            *current = boost::json::object{};
        if (not current->is_object())
            throw std::runtime_error(fmt::format("Can not set '{}': the value holding '{}' is not an object", key, part));

        current = &current->as_object()[part];
    }
    *current = std::move(value);
}

std::expected<Config, std::string>
ConfigReader::open(std::filesystem::path const& path)
{
    std::ifstream const in(path, std::ios::in | std::ios::binary);
    if (not in)
        return std::unexpected{fmt::format("Could not open configuration file '{}'", path.string())};

    std::stringstream contents;
    contents << in.rdbuf();

    boost::json::parse_options opts;
    opts.allow_comments = true;
    opts.allow_trailing_commas = true;

    boost::system::error_code ec;
    auto parsed = boost::json::parse(contents.str(), ec, {}, opts);
    if (ec) {
        return std::unexpected{
            fmt::format("Could not parse configuration file '{}': {}", path.string(), ec.message())
        };
    }

    if (not parsed.is_object())
        return std::unexpected{fmt::format("Configuration file '{}' must contain a JSON object", path.string())};

    return Config{std::move(parsed)};
}

}  // namespace util
