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

#include "proxy/HeaderFilter.hpp"

#include "util/log/Logger.hpp"
#include "util/requests/Types.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http = boost::beast::http;

namespace proxy {

namespace {

// RFC 9110 tchar
bool
isTokenChar(char c)
{
    if ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9'))
        return true;

    static constexpr std::string_view kEXTRA = "!#$%&'*+-.^_`|~";
    return kEXTRA.find(c) != std::string_view::npos;
}

}  // namespace

HeaderFilter::HeaderFilter(std::vector<http::field> dropped) : dropped_{std::move(dropped)}
{
}

HeaderFilter
HeaderFilter::rpc()
{
    return HeaderFilter{{http::field::host, http::field::content_length, http::field::transfer_encoding}};
}

HeaderFilter
HeaderFilter::passthrough()
{
    return HeaderFilter{{http::field::host, http::field::content_length, http::field::transfer_encoding}};
}

HeaderFilter::HeaderList
HeaderFilter::apply(http::fields const& headers) const
{
    HeaderList result;
    for (auto const& header : headers) {
        if (std::ranges::find(dropped_, header.name()) != dropped_.end())
            continue;

        auto const name = std::string_view{header.name_string().data(), header.name_string().size()};
        auto const value = std::string_view{header.value().data(), header.value().size()};

        if (not isValidName(name) or not isValidValue(value)) {
            LOG(log_.warn()) << "Skipping header that can not be forwarded: '" << name << "'";
            continue;
        }

        result.emplace_back(std::string{name}, std::string{value});
    }
    return result;
}

bool
HeaderFilter::isValidName(std::string_view name)
{
    return not name.empty() and std::ranges::all_of(name, isTokenChar);
}

bool
HeaderFilter::isValidValue(std::string_view value)
{
    return std::ranges::none_of(value, [](char c) { return c == '\r' or c == '\n' or c == '\0'; });
}

}  // namespace proxy
