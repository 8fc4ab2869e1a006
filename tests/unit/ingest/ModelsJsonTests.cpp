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
#include "ingest/ModelsJson.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/TestObject.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace ingest;
using namespace ingest::model;

namespace {

constexpr auto kEVENTS = R"json([
    {
        "kind": "looks-rare-v2-new-bid-ask-nonces",
        "origin": {
            "tx_hash": "0xABCDEF0000000000000000000000000000000000000000000000000000000001",
            "block_hash": "0x00000000000000000000000000000000000000000000000000000000000abcde",
            "block": 17700000,
            "log_index": 3,
            "timestamp": 1690000000,
            "contract_address": "0x0000000000E655fAe4d56241588680F86E3b2377"
        },
        "log": {
            "address": "0x0000000000E655fAe4d56241588680F86E3b2377",
            "topics": ["0xAA"],
            "data": "0x0102"
        }
    },
    {
        "kind": "weth-transfer",
        "origin": {
            "tx_hash": "0xabcdef0000000000000000000000000000000000000000000000000000000001",
            "block_hash": "0x00000000000000000000000000000000000000000000000000000000000abcde",
            "block": 17700000,
            "log_index": 4,
            "timestamp": 1690000000,
            "contract_address": "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2"
        },
        "log": {
            "address": "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2",
            "topics": ["0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef"],
            "data": "0x"
        }
    },
    {
        "kind": "erc20-transfer",
        "origin": {
            "tx_hash": "0xabcdef0000000000000000000000000000000000000000000000000000000001",
            "block_hash": "0x00000000000000000000000000000000000000000000000000000000000abcde",
            "block": 17700000,
            "log_index": 5,
            "batch_index": 2,
            "timestamp": 1690000000,
            "contract_address": "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2"
        },
        "log": {
            "address": "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2",
            "topics": [],
            "data": "0x"
        }
    }
])json";

struct ModelsJsonTests : LoggerFixture {};

}  // namespace

TEST_F(ModelsJsonTests, ReadsEventsAndKeepsUnknownKinds)
{
    auto const events = readRawEvents(boost::json::parse(kEVENTS));
    ASSERT_TRUE(events.has_value());
    ASSERT_EQ(events->size(), 3);

    auto const& first = events->at(0);
    EXPECT_EQ(first.kind, EventKind::LooksRareV2NewBidAskNonces);
    EXPECT_EQ(first.origin.txHash, "0xabcdef0000000000000000000000000000000000000000000000000000000001");
    EXPECT_EQ(first.origin.block, kBLOCK);
    EXPECT_EQ(first.origin.logIndex, 3);
    EXPECT_EQ(first.origin.batchIndex, 1);
    EXPECT_EQ(first.origin.timestamp, kTIMESTAMP);
    EXPECT_EQ(first.origin.contractAddress, kEXCHANGE);
    EXPECT_EQ(first.log.address, kEXCHANGE);
    EXPECT_EQ(first.log.topics, std::vector<std::string>{"0xaa"});
    EXPECT_EQ(first.log.data, (Bytes{0x01, 0x02}));
    EXPECT_TRUE(first.otherKind.empty());

    auto const& unknown = events->at(1);
    EXPECT_EQ(unknown.kind, EventKind::Other);
    EXPECT_EQ(unknown.otherKind, "weth-transfer");
    EXPECT_EQ(unknown.origin.logIndex, 4);
    EXPECT_EQ(unknown.log.topics.size(), 1);

    auto const& third = events->at(2);
    EXPECT_EQ(third.kind, EventKind::Erc20Transfer);
    EXPECT_EQ(third.origin.batchIndex, 2);
    EXPECT_TRUE(third.log.data.empty());

    EXPECT_NE(
        getLoggerString().find("Sync:DBG Event 1 has unknown kind 'weth-transfer'; only its log is used"),
        std::string::npos
    );
}

TEST_F(ModelsJsonTests, UnknownKindIsWrittenBackWithItsTag)
{
    auto const events = readRawEvents(boost::json::parse(kEVENTS));
    ASSERT_TRUE(events.has_value());

    auto const json = boost::json::value_from(events->at(1));
    EXPECT_EQ(json.as_object().at("kind").as_string(), "weth-transfer");
    EXPECT_EQ(boost::json::value_to<RawEvent>(json), events->at(1));
}

TEST_F(ModelsJsonTests, RejectsNonArray)
{
    auto const events = readRawEvents(boost::json::parse(R"json({"kind": "erc20-transfer"})json"));
    ASSERT_FALSE(events.has_value());
    EXPECT_EQ(events.error(), "Expected an array of events");
}

TEST_F(ModelsJsonTests, RejectsInvalidHexData)
{
    auto const events = readRawEvents(boost::json::parse(R"json([{
        "kind": "erc20-transfer",
        "origin": {
            "tx_hash": "0x01", "block_hash": "0x02", "block": 1, "log_index": 0, "timestamp": 1,
            "contract_address": "0x03"
        },
        "log": {"address": "0x03", "topics": [], "data": "0xzz"}
    }])json"));

    ASSERT_FALSE(events.has_value());
    EXPECT_TRUE(events.error().starts_with("Event 0 is invalid"));
}

TEST_F(ModelsJsonTests, RejectsMissingOrigin)
{
    auto const events = readRawEvents(boost::json::parse(R"json([{"kind": "looks-rare-v2-taker-bid"}])json"));

    ASSERT_FALSE(events.has_value());
    EXPECT_TRUE(events.error().starts_with("Event 0 is invalid"));
}

TEST_F(ModelsJsonTests, RawEventRoundTrip)
{
    auto const event = createRawEvent(EventKind::LooksRareV2TakerBid, createTakerTradeLog(), kTX_HASH, 9, 3);
    EXPECT_EQ(boost::json::value_to<RawEvent>(boost::json::value_from(event)), event);
}

TEST_F(ModelsJsonTests, WritesFillEvent)
{
    OnChainData data;
    data.fillEvents.push_back({
        .orderKind = OrderKind::LooksRareV2,
        .orderId = kORDER_HASH,
        .orderSide = OrderSide::Sell,
        .maker = kMAKER,
        .taker = kTAKER,
        .price = Amount{"1000000000000000000000"},
        .currency = kCURRENCY,
        .currencyPrice = 1'000'000,
        .usdPrice = std::nullopt,
        .contract = kCOLLECTION,
        .tokenId = "42",
        .amount = "1",
        .orderSourceId = 1,
        .aggregatorSourceId = std::nullopt,
        .fillSourceId = std::nullopt,
        .origin = createOrigin(kTX_HASH, 2, 1),
    });

    auto const json = boost::json::value_from(data).as_object();
    auto const& fill = json.at("fill_events").as_array().at(0).as_object();

    EXPECT_EQ(fill.at("order_kind").as_string(), "looks-rare-v2");
    EXPECT_EQ(fill.at("order_side").as_string(), "sell");
    EXPECT_EQ(fill.at("price").as_string(), "1000000000000000000000");
    EXPECT_EQ(fill.at("currency_price").as_string(), "1000000");
    EXPECT_TRUE(fill.at("usd_price").is_null());
    EXPECT_EQ(fill.at("order_source_id").as_int64(), 1);
    EXPECT_TRUE(fill.at("fill_source_id").is_null());
    EXPECT_EQ(fill.at("origin").as_object().at("log_index").as_uint64(), 2);
    EXPECT_EQ(fill.at("origin").as_object().at("tx_hash").as_string(), kTX_HASH);

    EXPECT_TRUE(json.at("nonce_cancel_events").as_array().empty());
    EXPECT_TRUE(json.at("maker_infos").as_array().empty());
}

TEST_F(ModelsJsonTests, WritesTriggers)
{
    OnChainData data;
    data.orderInfos.push_back({
        .context = "filled-0x01",
        .orderId = "0x01",
        .trigger = {.kind = TriggerKind::Sale, .txHash = kTX_HASH, .txTimestamp = kTIMESTAMP},
    });
    data.makerInfos.push_back({
        .context = "0x02-buy-approval",
        .maker = kMAKER,
        .trigger = {.kind = TriggerKind::ApprovalChange, .txHash = kTX_HASH, .txTimestamp = kTIMESTAMP},
        .data = {.kind = ApprovalKind::BuyApproval, .contract = kCURRENCY, .orderKind = OrderKind::LooksRareV2},
    });

    auto const json = boost::json::value_from(data).as_object();

    auto const& order = json.at("order_infos").as_array().at(0).as_object();
    EXPECT_EQ(order.at("id").as_string(), "0x01");
    EXPECT_EQ(order.at("trigger").as_object().at("kind").as_string(), "sale");

    auto const& maker = json.at("maker_infos").as_array().at(0).as_object();
    EXPECT_EQ(maker.at("trigger").as_object().at("kind").as_string(), "approval-change");
    EXPECT_EQ(maker.at("data").as_object().at("kind").as_string(), "buy-approval");
    EXPECT_EQ(maker.at("data").as_object().at("contract").as_string(), kCURRENCY);
}
