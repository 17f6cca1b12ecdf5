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

#include "util/config/impl/Helpers.hpp"

#include <boost/json/conversion.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <exception>
#include <expected>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

/**
 * @brief The proxy configuration: a JSON object queried with dotted keys such as `server.port`.
 *
 * Values are converted with `boost::json::value_to`, so any type with a `tag_invoke` overload can be read.
 * A key that runs through something other than an object is a configuration error and throws std::runtime_error.
 */
class Config final {
    boost::json::value store_;

public:
    explicit Config(boost::json::value store = {});

    /**
     * @brief Read a value if it is present.
     *
     * @throws std::runtime_error If the stored value has the wrong type or does not fit into Result
     */
    template <typename Result>
    [[nodiscard]] std::optional<Result>
    maybeValue(std::string_view key) const
    {
        auto const* element = find(key);
        if (element == nullptr)
            return std::nullopt;

        impl::checkKind<Result>(key, *element);
        try {
            return boost::json::value_to<Result>(*element);
        } catch (std::runtime_error const&) {
            throw;
        } catch (std::exception const& e) {
            throw std::runtime_error(impl::describeBadValue(key, e.what()));
        }
    }

    template <typename Result>
    [[nodiscard]] Result
    valueOr(std::string_view key, Result fallback) const
    {
        auto value = maybeValue<Result>(key);
        if (value.has_value())
            return std::move(value).value();
        return fallback;
    }

    /**
     * @brief Read a value that must be present.
     *
     * @throws std::runtime_error With `error` as the message if the value is missing or unusable
     */
    template <typename Result>
    [[nodiscard]] Result
    valueOrThrow(std::string_view key, std::string_view error) const
    {
        std::optional<Result> value;
        try {
            value = maybeValue<Result>(key);
        } catch (std::exception const&) {
            throw std::runtime_error(std::string{error});
        }

        if (not value.has_value())
            throw std::runtime_error(std::string{error});
        return std::move(value).value();
    }

    /**
     * @brief Each element of the array under key as its own Config, or fallback if nothing is stored there.
     */
    [[nodiscard]] std::vector<Config>
    arrayOr(std::string_view key, std::vector<Config> fallback) const;

    /**
     * @brief The object under key as its own Config, or fallback if there is no object there.
     */
    [[nodiscard]] Config
    sectionOr(std::string_view key, boost::json::object fallback) const;

    /**
     * @brief Store a value, creating the enclosing objects that are missing. Used for command line overrides.
     *
     * @throws std::runtime_error If the key runs through a value that is not an object
     */
    void
    set(std::string_view key, boost::json::value value);

private:
    boost::json::value const*
    find(std::string_view key) const;
};

/**
 * @brief Loads the configuration file. Comments and trailing commas are accepted.
 */
class ConfigReader final {
public:
    static std::expected<Config, std::string>
    open(std::filesystem::path const& path);
};

}  // namespace util
