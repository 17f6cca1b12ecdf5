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

#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>
#include <boost/log/core/record.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace util {

class Config;

/**
 * @brief Streams into a log record only if the record is going to be written.
 *
 * `LOG(log.debug()) << expensive();` does not call `expensive` when debug is filtered out for the channel.
 */
#define LOG(record)                                                  \
    if (auto tronbridge_record_ = record; not tronbridge_record_) { \
    } else                                                           \
        tronbridge_record_

/**
 * @brief Severity levels, printed as their three letter names.
 */
enum class Severity { TRC, DBG, NFO, WRN, ERR, FTL };

BOOST_LOG_ATTRIBUTE_KEYWORD(log_severity, "Severity", Severity);
BOOST_LOG_ATTRIBUTE_KEYWORD(log_channel, "Channel", std::string);

std::ostream&
operator<<(std::ostream& stream, Severity severity);

/**
 * @brief Read a severity from its configuration name, e.g. `"debug"`. Case is ignored.
 *
 * @throws std::runtime_error If the value is not a string or names no severity
 */
Severity
tag_invoke(boost::json::value_to_tag<Severity>, boost::json::value const& value);

/**
 * @brief The channels the proxy logs to. Severity can be configured per channel.
 */
inline constexpr std::array<std::string_view, 5> kLOG_CHANNELS = {"General", "WebServer", "Proxy", "RPC", "Requests"};

/**
 * @brief Thread-safe logger bound to one channel. Cheap to copy.
 */
class Logger final {
    using SourceType = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;
    mutable SourceType source_;

public:
    /**
     * @brief A record that is filled with `operator<<` and written when it goes out of scope.
     *
     * Converts to false when the severity is filtered out for the channel; streaming into it is then a no-op.
     */
    class Record final {
        boost::log::record record_;
        std::optional<boost::log::aux::record_pump<SourceType>> pump_;

    public:
        Record(SourceType& source, Severity severity);

        Record(Record const&) = delete;
        Record&
        operator=(Record const&) = delete;

        template <typename T>
        Record&
        operator<<(T&& data)
        {
            if (pump_.has_value())
                pump_->stream() << std::forward<T>(data);
            return *this;
        }

        explicit operator bool() const
        {
            return pump_.has_value();
        }
    };

    explicit Logger(std::string channel);

    [[nodiscard]] Record
    trace() const
    {
        return {source_, Severity::TRC};
    }

    [[nodiscard]] Record
    debug() const
    {
        return {source_, Severity::DBG};
    }

    [[nodiscard]] Record
    info() const
    {
        return {source_, Severity::NFO};
    }

    [[nodiscard]] Record
    warn() const
    {
        return {source_, Severity::WRN};
    }

    [[nodiscard]] Record
    error() const
    {
        return {source_, Severity::ERR};
    }

    [[nodiscard]] Record
    fatal() const
    {
        return {source_, Severity::FTL};
    }
};

/**
 * @brief Sets up the Boost.Log core and gives access to the `General` channel.
 */
class LogService {
    static Logger general_;

public:
    LogService() = delete;

    /**
     * @brief Configure sinks and per channel severities.
     *
     * Reads `log_level`, `log_format`, `log_to_console`, `log_channels` and, when `log_directory` is set, the file
     * rotation keys.
     *
     * @param config The application configuration
     * @throws std::runtime_error If a level is invalid or an override names an unknown channel
     */
    static void
    init(Config const& config);

    [[nodiscard]] static Logger::Record
    trace()
    {
        return general_.trace();
    }

    [[nodiscard]] static Logger::Record
    debug()
    {
        return general_.debug();
    }

    [[nodiscard]] static Logger::Record
    info()
    {
        return general_.info();
    }

    [[nodiscard]] static Logger::Record
    warn()
    {
        return general_.warn();
    }

    [[nodiscard]] static Logger::Record
    error()
    {
        return general_.error();
    }

    [[nodiscard]] static Logger::Record
    fatal()
    {
        return general_.fatal();
    }
};

}  // namespace util
