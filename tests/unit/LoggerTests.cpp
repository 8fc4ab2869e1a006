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

#include "util/LoggerFixtures.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/parse.hpp>
#include <fmt/core.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

using namespace util;

namespace {

constexpr auto kLINE = "some log";

}  // namespace

class LoggerTest : public LoggerFixture {};

class NoLoggerTest : public NoLoggerFixture {};

TEST_F(LoggerTest, ChannelAndSeverityPrefixEachLine)
{
    Logger const resolverLog{"Resolver"};
    resolverLog.info() << "Price of " << 3 << " tokens";
    checkEqual("Resolver:NFO Price of 3 tokens");

    LogService::error() << "General error";
    checkEqual("General:ERR General error");
}

TEST_F(LoggerTest, TraceOnlyPassesOnTraceChannel)
{
    Logger const syncLog{"Sync"};
    syncLog.trace() << kLINE;
    checkEmpty();

    syncLog.debug() << kLINE;
    checkEqual(fmt::format("Sync:DBG {}", kLINE));

    Logger const traceLog{"Trace"};
    traceLog.trace() << kLINE;
    checkEqual(fmt::format("Trace:TRC {}", kLINE));
}

#ifndef COVERAGE_ENABLED
TEST_F(LoggerTest, LogMacroSkipsFilteredArguments)
{
    Logger const log{"App"};

    auto evaluated = 0;
    auto expensive = [&evaluated] {
        ++evaluated;
        return "expensive";
    };

    LOG(log.trace()) << expensive();
    EXPECT_EQ(evaluated, 0);
    checkEmpty();

    LOG(log.warn()) << expensive();
    EXPECT_EQ(evaluated, 1);
    checkEqual("App:WRN expensive");
}
#endif

struct LogServiceInitTest : LoggerTest {
protected:
    config::ConfigDefinition config_ = config::gMarketsyncConfig;

    void
    parse(std::string_view json)
    {
        auto const errors = config_.parse(config::ConfigFileJson{boost::json::parse(json).as_object()});
        ASSERT_FALSE(errors.has_value());
    }

    void
    expectOnlyFrom(Logger const& log, std::string_view channel, std::string_view lowest)
    {
        log.debug() << kLINE;
        if (lowest == "DBG") {
            checkEqual(fmt::format("{}:DBG {}", channel, kLINE));
        } else {
            checkEmpty();
        }

        log.warn() << kLINE;
        if (lowest != "ERR") {
            checkEqual(fmt::format("{}:WRN {}", channel, kLINE));
        } else {
            checkEmpty();
        }

        log.error() << kLINE;
        checkEqual(fmt::format("{}:ERR {}", channel, kLINE));
    }
};

TEST_F(LogServiceInitTest, DefaultLevelAppliesToEveryChannel)
{
    parse(R"json({"log_level": "warn"})json");
    LogService::init(config_);

    for (auto const* channel : Logger::kCHANNELS)
        expectOnlyFrom(Logger{channel}, channel, "WRN");
}

TEST_F(LogServiceInitTest, ChannelOverrideWinsOverDefault)
{
    parse(R"json({
        "log_level": "error",
        "log_channels": [
            {"channel": "Resolver", "log_level": "debug"},
            {"channel": "Sync", "log_level": "warning"}
        ]
    })json");
    LogService::init(config_);

    expectOnlyFrom(Logger{"Resolver"}, "Resolver", "DBG");
    expectOnlyFrom(Logger{"Sync"}, "Sync", "WRN");
    expectOnlyFrom(Logger{"App"}, "App", "ERR");
}

TEST_F(LogServiceInitTest, OverrideWithoutLevelIsRejected)
{
    parse(R"json({"log_channels": [{"channel": "Sync"}]})json");
    EXPECT_THROW(LogService::init(config_), std::runtime_error);
}

TEST_F(LogServiceInitTest, UnknownChannelFailsConfigParsing)
{
    auto const errors = config_.parse(config::ConfigFileJson{
        boost::json::parse(R"json({"log_channels": [{"channel": "Ledger", "log_level": "info"}]})json").as_object()
    });
    ASSERT_TRUE(errors.has_value());
}

TEST_F(NoLoggerTest, NothingIsWritten)
{
    Logger const log{"Trace"};
    log.trace() << "Nothing";
    checkEmpty();

    LogService::fatal() << "Still nothing";
    checkEmpty();
    EXPECT_FALSE(LogService::enabled());
}
