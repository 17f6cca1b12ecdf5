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

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util::requests {

/**
 * @brief An absolute http(s) URL split into the parts needed to open a connection and build a request.
 */
struct Url {
    enum class Scheme { Http, Https };

    Scheme scheme = Scheme::Http;
    std::string host;          /**< Host to resolve, IPv6 literals without brackets */
    std::string port;          /**< Explicit port or the scheme's default */
    std::string target = "/";  /**< Path and optional query, always starts with '/' */
    bool defaultPort = true;   /**< Whether port was taken from the scheme */

    /**
     * @brief The value to use in the Host header.
     *
     * @return host[:port], with the port omitted when it is the scheme's default
     */
    [[nodiscard]] std::string
    authority() const;

    /**
     * @brief The target with an encoded query string appended.
     *
     * @param query The already encoded query; an empty query leaves the target untouched
     * @return The resulting request target
     */
    [[nodiscard]] std::string
    targetWithQuery(std::string_view query) const;

    [[nodiscard]] bool
    isSsl() const
    {
        return scheme == Scheme::Https;
    }

    bool
    operator==(Url const&) const = default;
};

/**
 * @brief Parse an absolute http:// or https:// URL.
 *
 * @param url The URL to parse
 * @return The parsed URL or an error message
 */
std::expected<Url, std::string>
parseUrl(std::string_view url);

/**
 * @brief Decoded query parameters in the order they appeared.
 */
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Split and percent-decode a query string ('+' decodes to a space).
 *
 * @param query The raw query, without the leading '?'
 * @return Decoded key/value pairs; a key without '=' gets an empty value
 */
QueryParams
parseQuery(std::string_view query);

/**
 * @brief Percent-encode key/value pairs into a query string.
 *
 * @param params The parameters to encode
 * @return `k1=v1&k2=v2...` or an empty string if there are no parameters
 */
std::string
encodeQuery(QueryParams const& params);

}  // namespace util::requests
