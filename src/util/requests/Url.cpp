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

#include "util/requests/Url.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace util::requests {

namespace {

constexpr std::string_view SCHEME_SEPARATOR = "://";

int
hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string
percentDecode(std::string_view input)
{
    std::string result;
    result.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        auto const c = input[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < input.size() && hexValue(input[i + 1]) >= 0 && hexValue(input[i + 2]) >= 0) {
            result += static_cast<char>((hexValue(input[i + 1]) << 4) | hexValue(input[i + 2]));
            i += 2;
        } else {
            // malformed escapes are kept as is
            result += c;
        }
    }
    return result;
}

std::string
percentEncode(std::string_view input)
{
    static constexpr std::string_view HEX_DIGITS = "0123456789ABCDEF";

    std::string result;
    result.reserve(input.size());

    for (auto const c : input) {
        auto const byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) != 0 || c == '-' || c == '.' || c == '_' || c == '~') {
            result += c;
        } else {
            result += '%';
            result += HEX_DIGITS[byte >> 4];
            result += HEX_DIGITS[byte & 0x0F];
        }
    }
    return result;
}

std::expected<std::string, std::string>
parsePort(std::string_view port, std::string_view url)
{
    std::uint16_t value = 0;
    auto const [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || value == 0)
        return std::unexpected{fmt::format("Invalid port '{}' in URL '{}'", port, url)};
    return std::to_string(value);
}

}  // namespace

std::string
Url::authority() const
{
    auto result = host.find(':') != std::string::npos ? fmt::format("[{}]", host) : host;
    if (not defaultPort)
        result += ":" + port;
    return result;
}

std::string
Url::targetWithQuery(std::string_view query) const
{
    if (query.empty())
        return target;

    auto const separator = target.find('?') == std::string::npos ? '?' : '&';
    return fmt::format("{}{}{}", target, separator, query);
}

std::expected<Url, std::string>
parseUrl(std::string_view url)
{
    auto const schemeEnd = url.find(SCHEME_SEPARATOR);
    if (schemeEnd == std::string_view::npos)
        return std::unexpected{fmt::format("URL '{}' has no scheme", url)};

    Url result;
    auto const scheme = url.substr(0, schemeEnd);
    if (boost::iequals(scheme, "http")) {
        result.scheme = Url::Scheme::Http;
        result.port = "80";
    } else if (boost::iequals(scheme, "https")) {
        result.scheme = Url::Scheme::Https;
        result.port = "443";
    } else {
        return std::unexpected{fmt::format("Unsupported scheme '{}' in URL '{}'", scheme, url)};
    }

    auto rest = url.substr(schemeEnd + SCHEME_SEPARATOR.size());
    if (auto const fragment = rest.find('#'); fragment != std::string_view::npos)
        rest = rest.substr(0, fragment);

    auto const authorityEnd = rest.find_first_of("/?");
    auto const authority = rest.substr(0, authorityEnd);
    auto const target = authorityEnd == std::string_view::npos ? std::string_view{} : rest.substr(authorityEnd);

    if (authority.find('@') != std::string_view::npos)
        return std::unexpected{fmt::format("Credentials in URL '{}' are not supported", url)};

    std::string_view portPart;
    if (authority.starts_with('[')) {
        auto const closing = authority.find(']');
        if (closing == std::string_view::npos)
            return std::unexpected{fmt::format("Unterminated IPv6 address in URL '{}'", url)};

        result.host = std::string{authority.substr(1, closing - 1)};
        auto const afterHost = authority.substr(closing + 1);
        if (not afterHost.empty()) {
            if (afterHost.front() != ':')
                return std::unexpected{fmt::format("Unexpected characters after IPv6 address in URL '{}'", url)};
            portPart = afterHost.substr(1);
            result.defaultPort = false;
        }
    } else {
        auto const colon = authority.rfind(':');
        result.host = std::string{authority.substr(0, colon)};
        if (colon != std::string_view::npos) {
            portPart = authority.substr(colon + 1);
            result.defaultPort = false;
        }
    }

    if (result.host.empty())
        return std::unexpected{fmt::format("URL '{}' has no host", url)};

    if (not result.defaultPort) {
        auto port = parsePort(portPart, url);
        if (not port.has_value())
            return std::unexpected{std::move(port).error()};
        result.port = std::move(port).value();
    }

    if (target.empty()) {
        result.target = "/";
    } else if (target.front() == '?') {
        result.target = fmt::format("/{}", target);
    } else {
        result.target = std::string{target};
    }

    return result;
}

QueryParams
parseQuery(std::string_view query)
{
    QueryParams result;

    while (not query.empty()) {
        auto const ampersand = query.find('&');
        auto const pair = query.substr(0, ampersand);
        query = ampersand == std::string_view::npos ? std::string_view{} : query.substr(ampersand + 1);

        if (pair.empty())
            continue;

        auto const equals = pair.find('=');
        if (equals == std::string_view::npos) {
            result.emplace_back(percentDecode(pair), std::string{});
        } else {
            result.emplace_back(percentDecode(pair.substr(0, equals)), percentDecode(pair.substr(equals + 1)));
        }
    }

    return result;
}

std::string
encodeQuery(QueryParams const& params)
{
    std::string result;
    for (auto const& [key, value] : params) {
        if (not result.empty())
            result += '&';
        result += percentEncode(key);
        result += '=';
        result += percentEncode(value);
    }
    return result;
}

}  // namespace util::requests
