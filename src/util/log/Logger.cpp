//------------------------------------------------------------------------------
/*
    This file is part of marketsync
    Copyright (c) 2025, the marketsync developers.

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

#include "util/Assert.hpp"
#include "util/BytesConverter.hpp"
#include "util/SourceLocation.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ObjectView.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time_duration.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/attributes/attribute_value_set.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/filter.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/filter.hpp>
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
#include <cstddef>
#include <cstdint>
#include <ios>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace util {

Logger LogService::generalLog = Logger{"General"};
boost::log::filter LogService::filter{};

namespace {

using ChannelSeverities = std::unordered_map<std::string, Severity>;

struct SeverityName {
    std::string_view name;
    Severity severity;
};

// "warn" is accepted as a shorthand for "warning"
constexpr SeverityName kSEVERITY_NAMES[] = {
    {.name = "trace", .severity = Severity::TRC},
    {.name = "debug", .severity = Severity::DBG},
    {.name = "info", .severity = Severity::NFO},
    {.name = "warning", .severity = Severity::WRN},
    {.name = "warn", .severity = Severity::WRN},
    {.name = "error", .severity = Severity::ERR},
    {.name = "fatal", .severity = Severity::FTL},
};

Severity
parseSeverity(std::string_view logLevel)
{
    auto const it = std::ranges::find_if(kSEVERITY_NAMES, [logLevel](auto const& entry) {
        return boost::iequals(entry.name, logLevel);
    });

    // log_level values are validated by the config constraints before we get here
    ASSERT(it != std::end(kSEVERITY_NAMES), "Unexpected log level '{}'", logLevel);
    return it->severity;
}

void
addConsoleSinks(std::string const& format, bool toStdout)
{
    namespace keywords = boost::log::keywords;

    if (toStdout) {
        boost::log::add_console_log(
            std::cout, keywords::format = format, keywords::filter = LogSeverity < Severity::FTL
        );
    }

    // fatal lines go to stderr even with console logging off
    boost::log::add_console_log(std::cerr, keywords::format = format, keywords::filter = LogSeverity >= Severity::FTL);
}

void
addRotatingFileSink(config::ConfigDefinition const& config, std::string const& directory, std::string const& format)
{
    namespace keywords = boost::log::keywords;
    namespace sinks = boost::log::sinks;

    boost::filesystem::path const dirPath{directory};
    if (not boost::filesystem::exists(dirPath))
        boost::filesystem::create_directories(dirPath);

    // sizes are configured in megabytes
    auto const rotationSize = mbToBytes(config.get<uint32_t>("log_rotation_size"));
    auto const maxDirSize = mbToBytes(config.get<uint32_t>("log_directory_max_size"));
    auto const rotationHours = config.get<uint32_t>("log_rotation_hour_interval");

    auto sink = boost::log::add_file_log(
        keywords::file_name = dirPath / "marketsync.log",
        keywords::target_file_name = dirPath / "marketsync_%Y-%m-%d_%H-%M-%S.log",
        keywords::auto_flush = true,
        keywords::format = format,
        keywords::open_mode = std::ios_base::app,
        keywords::rotation_size = rotationSize,
        keywords::time_based_rotation = sinks::file::rotation_at_time_interval(boost::posix_time::hours(rotationHours))
    );

    auto backend = sink->locked_backend();
    backend->set_file_collector(
        sinks::file::make_collector(keywords::target = dirPath, keywords::max_size = maxDirSize)
    );
    backend->scan_for_files();
}

ChannelSeverities
channelSeverities(config::ConfigDefinition const& config, Severity defaultSeverity)
{
    ChannelSeverities result;
    for (auto const* channel : Logger::kCHANNELS)
        result.emplace(channel, defaultSeverity);

    for (auto const& entry : config.getArray("log_channels")) {
        auto const name = entry.maybeValue<std::string>("channel");
        auto const level = entry.maybeValue<std::string>("log_level");
        if (not name.has_value() or not level.has_value())
            throw std::runtime_error("Log channel overrides need both 'channel' and 'log_level'");

        auto it = result.find(*name);
        if (it == result.end())
            throw std::runtime_error(fmt::format("Can't override settings for log channel {}: invalid channel", *name));

        it->second = parseSeverity(*level);
    }

    return result;
}

}  // namespace

std::ostream&
operator<<(std::ostream& stream, Severity sev)
{
    switch (sev) {
        case Severity::TRC:
            return stream << "TRC";
        case Severity::DBG:
            return stream << "DBG";
        case Severity::NFO:
            return stream << "NFO";
        case Severity::WRN:
            return stream << "WRN";
        case Severity::ERR:
            return stream << "ERR";
        case Severity::FTL:
            return stream << "FTL";
    }
    std::unreachable();
}

void
LogService::init(config::ConfigDefinition const& config)
{
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<Severity, char>("Severity");

    auto const format = config.get<std::string>("log_format");
    addConsoleSinks(format, config.get<bool>("log_to_console"));

    if (auto const logDir = config.maybeValue<std::string>("log_directory"); logDir.has_value())
        addRotatingFileSink(config, *logDir, format);

    auto const defaultSeverity = parseSeverity(config.get<std::string>("log_level"));
    auto severities = channelSeverities(config, defaultSeverity);

    filter = boost::log::filter{[severities = std::move(severities),
                                 defaultSeverity](boost::log::attribute_value_set const& attributes) {
        auto const channel = attributes[LogChannel];
        auto const severity = attributes[LogSeverity];
        if (not channel or not severity)
            return false;

        auto const it = severities.find(channel.get());
        return severity.get() >= (it != severities.end() ? it->second : defaultSeverity);
    }};
    boost::log::core::get()->set_filter(filter);

    LOG(LogService::info()) << "Default log level = " << defaultSeverity;
}

bool
LogService::enabled()
{
    return boost::log::core::get()->get_logging_enabled();
}

Logger::Pump
Logger::trace(SourceLocationType const& loc) const
{
    return {logger_, Severity::TRC, loc};
}

Logger::Pump
Logger::debug(SourceLocationType const& loc) const
{
    return {logger_, Severity::DBG, loc};
}

Logger::Pump
Logger::info(SourceLocationType const& loc) const
{
    return {logger_, Severity::NFO, loc};
}

Logger::Pump
Logger::warn(SourceLocationType const& loc) const
{
    return {logger_, Severity::WRN, loc};
}

Logger::Pump
Logger::error(SourceLocationType const& loc) const
{
    return {logger_, Severity::ERR, loc};
}

Logger::Pump
Logger::fatal(SourceLocationType const& loc) const
{
    return {logger_, Severity::FTL, loc};
}

std::string
Logger::Pump::prettyPath(SourceLocationType const& loc, size_t maxDepth)
{
    // keep the last maxDepth path components, e.g. "ingest/impl/Normalizer.cpp:42"
    std::string_view path{loc.file_name()};
    auto start = path.size();
    for (size_t depth = 0; depth < maxDepth; ++depth) {
        auto const slash = start == 0 ? std::string_view::npos : path.rfind('/', start - 1);
        if (slash == std::string_view::npos) {
            start = 0;
            break;
        }
        start = slash;
    }

    path.remove_prefix(start);
    if (path.starts_with('/'))
        path.remove_prefix(1);

    return fmt::format("{}:{}", path, loc.line());
}

}  // namespace util
