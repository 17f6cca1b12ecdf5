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

#include "proxy/DestinationClientInterface.hpp"
#include "util/config/Config.hpp"
#include "util/requests/Types.hpp"
#include "util/requests/Url.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace proxy {

/**
 * @brief Sends requests to the destination over plain TCP or TLS depending on the URL scheme.
 *
 * A new connection is opened for every request.
 */
class DestinationClient : public DestinationClientInterface {
    util::requests::Url url_;
    std::chrono::milliseconds timeout_;
    std::uint64_t bodyLimit_;

public:
    static constexpr std::chrono::milliseconds kDEFAULT_TIMEOUT{30000};
    static constexpr std::uint64_t kDEFAULT_MAX_RESPONSE_SIZE = 64 * 1024 * 1024;

    /**
     * @brief Construct a new client
     *
     * @param url The destination
     * @param timeout The limit for each network operation
     * @param bodyLimit The maximum size of a response body
     */
    DestinationClient(
        util::requests::Url url,
        std::chrono::milliseconds timeout = kDEFAULT_TIMEOUT,
        std::uint64_t bodyLimit = kDEFAULT_MAX_RESPONSE_SIZE
    );

    std::expected<util::requests::HttpResponse, util::requests::RequestError>
    post(std::string body, std::vector<util::requests::HttpHeader> const& headers, boost::asio::yield_context yield)
        const override;

    std::expected<util::requests::HttpResponse, util::requests::RequestError>
    get(std::string_view query,
        std::vector<util::requests::HttpHeader> const& headers,
        boost::asio::yield_context yield) const override;

    /**
     * @return The destination this client sends to
     */
    util::requests::Url const&
    url() const;
};

/**
 * @brief Create a destination client from the `destination` section of the configuration.
 *
 * @param config The configuration
 * @return The client or an error message if the destination is missing or invalid
 */
std::expected<DestinationClient, std::string>
make_DestinationClient(util::Config const& config);

}  // namespace proxy
