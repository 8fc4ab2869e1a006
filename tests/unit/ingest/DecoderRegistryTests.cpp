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

#include "ingest/DecodeError.hpp"
#include "ingest/Models.hpp"
#include "ingest/impl/AbiReader.hpp"
#include "ingest/impl/DecoderRegistry.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/TestObject.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>

using namespace ingest;
using namespace ingest::impl;
using namespace ingest::model;

struct DecoderRegistryTests : NoLoggerFixture {};

TEST_F(DecoderRegistryTests, EmptyRegistryIsUnavailable)
{
    DecoderRegistry const registry;

    EXPECT_FALSE(registry.isAvailable());

    auto const result = registry.decode(EventKind::LooksRareV2TakerAsk, createTakerTradeLog());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeError::Code::RegistryUnavailable);
}

TEST_F(DecoderRegistryTests, MissingKindIsUnknown)
{
    DecoderRegistry registry;
    registry.add(EventKind::LooksRareV2TakerAsk, [](RawLog const&) -> DecodedEvent {
        return NoncesCancelled{};
    });

    EXPECT_TRUE(registry.isAvailable());

    auto const result = registry.decode(EventKind::LooksRareV2TakerBid, createTakerTradeLog());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeError::Code::UnknownKind);
}

TEST_F(DecoderRegistryTests, MalformedPayloadIsReported)
{
    DecoderRegistry registry;
    registry.add(EventKind::LooksRareV2TakerAsk, [](RawLog const&) -> DecodedEvent {
        throw MalformedPayload("bad payload");
    });

    auto const result = registry.decode(EventKind::LooksRareV2TakerAsk, createTakerTradeLog());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeError::Code::Malformed);
    EXPECT_NE(result.error().message.find("bad payload"), std::string::npos);
}

TEST_F(DecoderRegistryTests, DefaultRegistryDecodesAllKinds)
{
    auto const registry = makeDecoderRegistry();
    ASSERT_TRUE(registry->isAvailable());

    auto const bulk = registry->decode(EventKind::LooksRareV2NewBidAskNonces, createNewBidAskNoncesLog(kMAKER, 1, 2));
    ASSERT_TRUE(bulk.has_value());
    EXPECT_TRUE(std::holds_alternative<BidAskNonces>(*bulk));

    auto const subset =
        registry->decode(EventKind::LooksRareV2SubsetNoncesCancelled, createNoncesCancelledLog(kMAKER, {1}));
    ASSERT_TRUE(subset.has_value());
    EXPECT_TRUE(std::get<NoncesCancelled>(*subset).isSubset);

    auto const order =
        registry->decode(EventKind::LooksRareV2OrderNoncesCancelled, createNoncesCancelledLog(kMAKER, {1}));
    ASSERT_TRUE(order.has_value());
    EXPECT_FALSE(std::get<NoncesCancelled>(*order).isSubset);

    auto const ask = registry->decode(EventKind::LooksRareV2TakerAsk, createTakerTradeLog());
    ASSERT_TRUE(ask.has_value());
    EXPECT_EQ(std::get<TakerTrade>(*ask).orderSide, OrderSide::Buy);

    auto const bid = registry->decode(EventKind::LooksRareV2TakerBid, createTakerTradeLog());
    ASSERT_TRUE(bid.has_value());
    EXPECT_EQ(std::get<TakerTrade>(*bid).orderSide, OrderSide::Sell);
}

TEST_F(DecoderRegistryTests, DefaultRegistryReportsTruncatedPayload)
{
    auto const registry = makeDecoderRegistry();
    auto log = createNewBidAskNoncesLog(kMAKER, 1, 2);
    log.data.resize(40);

    auto const result = registry->decode(EventKind::LooksRareV2NewBidAskNonces, log);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeError::Code::Malformed);
}
