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

#include "app/CliArgs.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstdlib>
#include <string>

using namespace app;

class CliArgsTests : public testing::Test {
protected:
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::Run)>> onRunMock_;
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::Exit)>> onExitMock_;
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::VerifyConfig)>> onVerifyMock_;
};

TEST_F(CliArgsTests, Run)
{
    std::array argv{"marketsync", "--conf", "conf.json", "--events", "events.json"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    int const returnCode = 123;
    EXPECT_CALL(onRunMock_, Call).WillOnce([](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, "conf.json");
        EXPECT_EQ(run.eventsPath, "events.json");
        return returnCode;
    });
    EXPECT_EQ(
        action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()),
        returnCode
    );
}

TEST_F(CliArgsTests, RunWithPositionalConfigAndShortOptions)
{
    std::array argv{"marketsync", "conf.json", "-e", "events.json"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock_, Call).WillOnce([](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, "conf.json");
        EXPECT_EQ(run.eventsPath, "events.json");
        return 0;
    });
    EXPECT_EQ(action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()), 0);
}

TEST_F(CliArgsTests, RunWithoutEventsExitsWithFailure)
{
    std::array argv{"marketsync", "--conf", "conf.json"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onExitMock_, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
    EXPECT_EQ(
        action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()),
        EXIT_FAILURE
    );
}

TEST_F(CliArgsTests, DefaultConfigPath)
{
    std::array argv{"marketsync", "--verify"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onVerifyMock_, Call).WillOnce([](CliArgs::Action::VerifyConfig const& verify) {
        EXPECT_EQ(verify.configPath, CliArgs::kDEFAULT_CONFIG_PATH);
        return 0;
    });
    EXPECT_EQ(action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()), 0);
}

TEST_F(CliArgsTests, Verify)
{
    std::array argv{"marketsync", "--conf", "conf.json", "--verify"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onVerifyMock_, Call).WillOnce([](CliArgs::Action::VerifyConfig const& verify) {
        EXPECT_EQ(verify.configPath, "conf.json");
        return 0;
    });
    EXPECT_EQ(action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()), 0);
}

TEST_F(CliArgsTests, Help)
{
    std::array argv{"marketsync", "--help"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onExitMock_, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
    EXPECT_EQ(
        action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()),
        EXIT_SUCCESS
    );
}

TEST_F(CliArgsTests, ConfigDescription)
{
    std::array argv{"marketsync", "--config-description"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onExitMock_, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
    EXPECT_EQ(
        action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()),
        EXIT_SUCCESS
    );
}

TEST_F(CliArgsTests, UnknownOptionExitsWithFailure)
{
    std::array argv{"marketsync", "--bogus"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onExitMock_, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
    EXPECT_EQ(
        action.apply(onRunMock_.AsStdFunction(), onExitMock_.AsStdFunction(), onVerifyMock_.AsStdFunction()),
        EXIT_FAILURE
    );
}
