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

#include "web/Request.hpp"

#include <boost/beast/http/verb.hpp>

#include <optional>
#include <string_view>
#include <utility>

namespace web {

Request::Request(HttpRequest request) : request_{std::move(request)}
{
}

Request::Method
Request::method() const
{
    using boost::beast::http::verb;

    switch (request_.method()) {
        case verb::get:
            return Method::GET;
        case verb::post:
            return Method::POST;
        case verb::head:
            return Method::HEAD;
        default:
            return Method::UNSUPPORTED;
    }
}

Request::HttpRequest const&
Request::asHttpRequest() const
{
    return request_;
}

std::string_view
Request::body() const
{
    return request_.body();
}

std::string_view
Request::target() const
{
    return request_.target();
}

std::string_view
Request::path() const
{
    auto const whole = target();
    return whole.substr(0, whole.find('?'));
}

std::optional<std::string_view>
Request::query() const
{
    auto const whole = target();
    if (auto const mark = whole.find('?'); mark != std::string_view::npos)
        return whole.substr(mark + 1);
    return std::nullopt;
}

Request::HttpHeaders const&
Request::headers() const
{
    return request_.base();
}

}  // namespace web
