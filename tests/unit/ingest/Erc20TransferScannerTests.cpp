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

#include "ingest/Models.hpp"
#include "ingest/impl/Erc20TransferScanner.hpp"
#include "util/TestObject.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace ingest::impl;
using ingest::model::RawLog;

namespace {

constexpr auto kWETH = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";
constexpr auto kUSDC = "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48";

}  // namespace

TEST(Erc20TransferScannerTests, NoLogs)
{
    EXPECT_FALSE(Erc20TransferScanner{}.scan({}).has_value());
}

TEST(Erc20TransferScannerTests, FindsErc20Transfer)
{
    std::vector<RawLog> const logs = {createTakerTradeLog(), createErc20TransferLog(kWETH)};
    EXPECT_EQ(Erc20TransferScanner{}.scan(logs), kWETH);
}

TEST(Erc20TransferScannerTests, IgnoresErc721Transfer)
{
    std::vector<RawLog> const logs = {createErc721TransferLog(kCOLLECTION), createTakerTradeLog()};
    EXPECT_FALSE(Erc20TransferScanner{}.scan(logs).has_value());
}

TEST(Erc20TransferScannerTests, ReturnsFirstTransferLowerCased)
{
    std::vector<RawLog> const logs = {
        createErc721TransferLog(kCOLLECTION),
        createErc20TransferLog("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"),
        createErc20TransferLog(kWETH),
    };
    EXPECT_EQ(Erc20TransferScanner{}.scan(logs), kUSDC);
}

TEST(Erc20TransferScannerTests, MatchesUpperCaseSignature)
{
    auto log = createErc20TransferLog(kWETH);
    log.topics[0] = "0xDDF252AD1BE2C89B69C2B068FC378DAA952BA7F163C4A11628F55A4DF523B3EF";

    EXPECT_EQ(Erc20TransferScanner{}.scan({log}), kWETH);
}
