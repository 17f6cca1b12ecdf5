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

#include "util/log/Logger.hpp"

#include "util/config/Config.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time_duration.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/predicates/channel_severity_filter.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/keywords/max_size.hpp>
#include <boost/log/keywords/open_mode.hpp>
#include <boost/log/keywords/rotation_size.hpp>
#include <boost/log/keywords/target.hpp>
#include <boost/log/keywords/target_file_name.hpp>
#include <boost/log/keywords/time_based_rotation.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace util {

namespace {

constexpr std::uint64_t kMEGABYTE = 1024u * 1024u;
constexpr std::string_view kDEFAULT_FORMAT = "%TimeStamp% [%ThreadID%] %Channel%:%Severity% %Message%";

constexpr std::array<std::pair<std::string_view, Severity>, 7> kSEVERITY_NAMES = {{
    {"trace", Severity::TRC},
    {"debug", Severity::DBG},
    {"info", Severity::NFO},
    {"warning", Severity::WRN},
    {"warn", Severity::WRN},
    {"error", Severity::ERR},
    {"fatal", Severity::FTL},
}};

void
addFileSink(Config const& config, boost::filesystem::path const& directory, std::string const& format)
{
    namespace keywords = boost::log::keywords;
    namespace sinks = boost::log::sinks;

    if (not boost::filesystem::exists(directory))
        boost::filesystem::create_directories(directory);

    auto const rotationSize = config.valueOr<std::uint64_t>("log_rotation_size", 2048u) * kMEGABYTE;
    auto const rotationHours = config.valueOr<std::uint32_t>("log_rotation_hour_interval", 12u);
    auto const directorySize = config.valueOr<std::uint64_t>("log_directory_max_size", 50u * 1024u) * kMEGABYTE;

    auto sink = boost::log::add_file_log(
        keywords::file_name = directory / "tronbridge.log",
        keywords::target_file_name = directory / "tronbridge_%Y-%m-%d_%H-%M-%S.log",
        keywords::auto_flush = true,
        keywords::format = format,
        keywords::open_mode = std::ios_base::app,
        keywords::rotation_size = rotationSize,
        keywords::time_based_rotation = sinks::file::rotation_at_time_interval(boost::posix_time::hours(rotationHours))
    );

    auto backend = sink->locked_backend();
    backend->set_file_collector(
        sinks::file::make_collector(keywords::target = directory, keywords::max_size = directorySize)
    );
    backend->scan_for_files();
}

void
applySeverityFilter(Config const& config, Severity defaultSeverity)
{
    auto filter = boost::log::expressions::channel_severity_filter(log_channel, log_severity);
    for (auto const channel : kLOG_CHANNELS)
        filter[std::string{channel}] = defaultSeverity;

    for (auto const& channelConfig : config.arrayOr("log_channels", {})) {
        auto const name = channelConfig.valueOrThrow<std::string>("channel", "Log channel override needs a `channel`");
        if (std::ranges::find(kLOG_CHANNELS, name) == kLOG_CHANNELS.end())
            throw std::runtime_error(fmt::format("Unknown log channel '{}' in `log_channels`", name));

        filter[name] = channelConfig.valueOr<Severity>("log_level", defaultSeverity);
    }

    boost::log::core::get()->set_filter(filter);
}

}  // namespace

Logger LogService::general_{"General"};

std::ostream&
operator<<(std::ostream& stream, Severity severity)
{
    static constexpr std::array<char const*, 6> kLABELS = {"TRC", "DBG", "NFO", "WRN", "ERR", "FTL"};
    return stream << kLABELS.at(static_cast<std::size_t>(severity));
}

Severity
tag_invoke(boost::json::value_to_tag<Severity>, boost::json::value const& value)
{
    if (not value.is_string())
        throw std::runtime_error("`log_level` must be a string");

    auto const& name = value.as_string();
    auto const it = std::ranges::find_if(kSEVERITY_NAMES, [&name](auto const& entry) {
        return boost::iequals(entry.first, std::string_view{name.data(), name.size()});
    });
    if (it == kSEVERITY_NAMES.end())
        throw std::runtime_error(fmt::format("Unknown `log_level` '{}'", std::string_view{name.data(), name.size()}));

    return it->second;
}

Logger::Record::Record(SourceType& source, Severity severity)
    : record_{source.open_record(boost::log::keywords::severity = severity)}
{
    if (record_)
        pump_.emplace(boost::log::aux::make_record_pump(source, record_));
}

Logger::Logger(std::string channel) : source_{boost::log::keywords::channel = std::move(channel)}
{
}

void
LogService::init(Config const& config)
{
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<Severity, char>("Severity");

    auto const format = config.valueOr<std::string>("log_format", std::string{kDEFAULT_FORMAT});
    if (config.valueOr("log_to_console", true))
        boost::log::add_console_log(std::cout, boost::log::keywords::format = format);

    if (auto const directory = config.maybeValue<std::string>("log_directory"); directory.has_value())
        addFileSink(config, *directory, format);

    auto const defaultSeverity = config.valueOr<Severity>("log_level", Severity::NFO);
    applySeverityFilter(config, defaultSeverity);

    LOG(general_.info()) << "Default log level = " << defaultSeverity;
}

}  // namespace util
