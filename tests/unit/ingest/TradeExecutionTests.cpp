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
#include "ingest/RegistryInterface.hpp"
#include "ingest/Stats.hpp"
#include "ingest/ext/TradeExecution.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockResolvers.hpp"
#include "util/TestObject.hpp"

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ingest;
using namespace ingest::ext;
using namespace ingest::model;
using testing::_;
using testing::Return;

namespace {

constexpr auto kWETH = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";

TakerTrade
createTrade(OrderSide side, Amount const& fee = 1000, Amount const& amount = 1)
{
    return {
        .orderKind = OrderKind::LooksRareV2,
        .orderSide = side,
        .orderId = kORDER_HASH,
        .orderNonce = 7,
        .isNonceInvalidated = true,
        .maker = kMAKER,
        .taker = kTAKER,
        .strategyId = 0,
        .currency = kCURRENCY,
        .collection = kCOLLECTION,
        .itemIds = {42},
        .amounts = {amount},
        .feeRecipients = {kRECIPIENT, "0x0000000000000000000000000000000000000000"},
        .feeAmounts = {fee, 5, 20},
    };
}

struct TradeExecutionTests : LoggerFixture {
    std::shared_ptr<testing::StrictMock<MockAttributionResolver>> attribution =
        std::make_shared<testing::StrictMock<MockAttributionResolver>>();
    std::shared_ptr<testing::StrictMock<MockPriceResolver>> prices =
        std::make_shared<testing::StrictMock<MockPriceResolver>>();
    std::shared_ptr<testing::StrictMock<MockErc20TransferScanner>> scanner =
        std::make_shared<testing::StrictMock<MockErc20TransferScanner>>();

    TradeExecution rule{attribution, prices, scanner};

    RawEvent event = createRawEvent(EventKind::LooksRareV2TakerBid, createTakerTradeLog(), kTX_HASH, 4);
    std::vector<RawLog> txLogs = {event.log};
    OnChainData out;
    Stats stats;

    void
    settle(TakerTrade const& trade)
    {
        EventContext ctx{.event = event, .txLogs = txLogs, .out = out, .stats = stats};
        rule.onEvent(ctx, trade);
    }
};

}  // namespace

TEST_F(TradeExecutionTests, TakerBidProducesAllRecords)
{
    EXPECT_CALL(*attribution, resolve(kTX_HASH, OrderKind::LooksRareV2, _)).WillOnce(Return(Attribution{}));
    EXPECT_CALL(*prices, resolve(kCURRENCY, Amount{1000000}, kTIMESTAMP))
        .WillOnce(Return(Prices{.nativePrice = Amount{500}, .usdPrice = Amount{1000}}));
    EXPECT_CALL(*scanner, scan).WillOnce(Return(std::nullopt));

    settle(createTrade(OrderSide::Sell, 1000000));

    ASSERT_EQ(out.fillEvents.size(), 1);
    auto const& fill = out.fillEvents.front();
    EXPECT_EQ(fill.orderId, kORDER_HASH);
    EXPECT_EQ(fill.orderSide, OrderSide::Sell);
    EXPECT_EQ(fill.maker, kMAKER);
    EXPECT_EQ(fill.taker, kTAKER);
    EXPECT_EQ(fill.price, 500);
    EXPECT_EQ(fill.usdPrice, Amount{1000});
    EXPECT_EQ(fill.currencyPrice, 1000000);
    EXPECT_EQ(fill.currency, kCURRENCY);
    EXPECT_EQ(fill.contract, kCOLLECTION);
    EXPECT_EQ(fill.tokenId, "42");
    EXPECT_EQ(fill.amount, "1");
    EXPECT_FALSE(fill.orderSourceId.has_value());
    EXPECT_EQ(fill.origin, event.origin);

    ASSERT_EQ(out.nonceCancelEvents.size(), 1);
    EXPECT_EQ(out.nonceCancelEvents.front().nonce, 7);
    EXPECT_EQ(out.nonceCancelEvents.front().maker, kMAKER);
    EXPECT_FALSE(out.nonceCancelEvents.front().isSubset);

    ASSERT_EQ(out.orderInfos.size(), 1);
    EXPECT_EQ(out.orderInfos.front().context, fmt::format("filled-{}", kORDER_HASH));
    EXPECT_EQ(out.orderInfos.front().trigger.kind, TriggerKind::Sale);
    EXPECT_EQ(out.orderInfos.front().trigger.txHash, kTX_HASH);
    EXPECT_EQ(out.orderInfos.front().trigger.txTimestamp, kTIMESTAMP);

    ASSERT_EQ(out.fillInfos.size(), 1);
    EXPECT_EQ(out.fillInfos.front().context, kORDER_HASH);
    EXPECT_EQ(out.fillInfos.front().price, 500);
    EXPECT_EQ(out.fillInfos.front().timestamp, kTIMESTAMP);

    EXPECT_TRUE(out.makerInfos.empty());
    EXPECT_TRUE(out.bulkCancelEvents.empty());
}

TEST_F(TradeExecutionTests, Erc20TransferAddsMakerInfo)
{
    EXPECT_CALL(*attribution, resolve).WillOnce(Return(Attribution{}));
    EXPECT_CALL(*prices, resolve).WillOnce(Return(Prices{.nativePrice = Amount{1000}, .usdPrice = std::nullopt}));
    EXPECT_CALL(*scanner, scan(txLogs)).WillOnce(Return(std::string{kWETH}));

    settle(createTrade(OrderSide::Buy));

    ASSERT_EQ(out.makerInfos.size(), 1);
    auto const& info = out.makerInfos.front();
    EXPECT_EQ(info.context, fmt::format("{}-buy-approval", kTX_HASH));
    EXPECT_EQ(info.maker, kMAKER);
    EXPECT_EQ(info.trigger.kind, TriggerKind::ApprovalChange);
    EXPECT_EQ(info.data.kind, ApprovalKind::BuyApproval);
    EXPECT_EQ(info.data.contract, kWETH);
    EXPECT_EQ(info.data.orderKind, OrderKind::LooksRareV2);
    EXPECT_FALSE(out.fillEvents.front().usdPrice.has_value());
}

TEST_F(TradeExecutionTests, AttributionOverridesTakerAndSources)
{
    EXPECT_CALL(*attribution, resolve).WillOnce(Return(Attribution{
        .taker = std::string{kRECIPIENT},
        .orderSource = Source{.id = 1, .domain = "looksrare.org"},
        .aggregatorSource = std::nullopt,
        .fillSource = Source{.id = 3, .domain = "reservoir.tools"},
    }));
    EXPECT_CALL(*prices, resolve).WillOnce(Return(Prices{.nativePrice = Amount{1000}, .usdPrice = std::nullopt}));
    EXPECT_CALL(*scanner, scan).WillOnce(Return(std::nullopt));

    settle(createTrade(OrderSide::Sell));

    ASSERT_EQ(out.fillEvents.size(), 1);
    EXPECT_EQ(out.fillEvents.front().taker, kRECIPIENT);
    EXPECT_EQ(out.fillEvents.front().orderSourceId, 1);
    EXPECT_FALSE(out.fillEvents.front().aggregatorSourceId.has_value());
    EXPECT_EQ(out.fillEvents.front().fillSourceId, 3);
    EXPECT_EQ(out.fillInfos.front().taker, kRECIPIENT);
    EXPECT_EQ(out.fillInfos.front().maker, kMAKER);
}

TEST_F(TradeExecutionTests, CurrencyPriceIsPerUnit)
{
    EXPECT_CALL(*attribution, resolve).WillOnce(Return(Attribution{}));
    EXPECT_CALL(*prices, resolve(_, Amount{333}, _))
        .WillOnce(Return(Prices{.nativePrice = Amount{333}, .usdPrice = std::nullopt}));
    EXPECT_CALL(*scanner, scan).WillOnce(Return(std::nullopt));

    settle(createTrade(OrderSide::Sell, 1000, 3));

    ASSERT_EQ(out.fillEvents.size(), 1);
    auto const& fill = out.fillEvents.front();
    EXPECT_EQ(fill.currencyPrice, 333);
    EXPECT_EQ(fill.amount, "3");
    EXPECT_LE(fill.currencyPrice * 3, Amount{1000});
}

TEST_F(TradeExecutionTests, BundleIsSkipped)
{
    auto trade = createTrade(OrderSide::Sell);
    trade.itemIds = {1, 2};
    trade.amounts = {1, 1};

    settle(trade);

    EXPECT_TRUE(out.empty());
    EXPECT_EQ(stats.snapshot().bundleSkips, 1);
}

TEST_F(TradeExecutionTests, MissingNativePriceDropsTrade)
{
    EXPECT_CALL(*attribution, resolve).WillOnce(Return(Attribution{}));
    EXPECT_CALL(*prices, resolve).WillOnce(Return(Prices{}));

    settle(createTrade(OrderSide::Buy));

    EXPECT_TRUE(out.empty());
    EXPECT_EQ(stats.snapshot().missingPrices, 1);
    EXPECT_NE(getLoggerString().find("Sync:DBG No native price"), std::string::npos);
}

TEST_F(TradeExecutionTests, ZeroAmountIsDataQualityIssue)
{
    settle(createTrade(OrderSide::Buy, 1000, 0));

    EXPECT_TRUE(out.empty());
    EXPECT_EQ(stats.snapshot().dataQualitySkips, 1);
    EXPECT_NE(getLoggerString().find("Sync:WRN Data quality"), std::string::npos);
}
