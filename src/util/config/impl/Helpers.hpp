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

#include <boost/json/kind.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace util::impl {

/**
 * @brief Split a dotted key into its parts.
 *
 * @throws std::runtime_error If the key or one of its parts is empty
 */
std::vector<std::string_view>
splitKey(std::string_view key);

std::string
describeBadValue(std::string_view key, std::string_view reason);

/**
 * @brief Reject JSON kinds that can not be read as Result, before Boost.JSON tries a lossy conversion.
 */
template <typename Result>
void
checkKind(std::string_view key, boost::json::value const& value)
{
    char const* expected = nullptr;
    if constexpr (std::is_same_v<Result, bool>) {
        if (not value.is_bool())
            expected = "a boolean";
    } else if constexpr (std::is_same_v<Result, std::string>) {
        if (not value.is_string())
            expected = "a string";
    } else if constexpr (std::is_floating_point_v<Result>) {
        if (not value.is_number())
            expected = "a number";
    } else if constexpr (std::is_integral_v<Result>) {
        if (not value.is_int64() and not value.is_uint64())
            expected = "an integer";
    }

    if (expected != nullptr) {
        auto const kindName = boost::json::to_string(value.kind());
        std::string_view const actual{kindName.data(), kindName.size()};
        throw std::runtime_error(describeBadValue(key, fmt::format("expected {}, found {}", expected, actual)));
    }
}

}  // namespace util::impl
