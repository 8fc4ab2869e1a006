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

#include "ingest/impl/LooksRareV2.hpp"

#include "ingest/Models.hpp"
#include "ingest/impl/AbiReader.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <string>

namespace ingest::impl::looksrare_v2 {

namespace {

// Head words shared by TakerAsk and TakerBid
constexpr std::size_t kORDER_HASH = 0;
constexpr std::size_t kORDER_NONCE = 1;
constexpr std::size_t kIS_NONCE_INVALIDATED = 2;
constexpr std::size_t kFIRST_USER = 3;
constexpr std::size_t kSECOND_USER = 4;
constexpr std::size_t kSTRATEGY_ID = 5;
constexpr std::size_t kCURRENCY = 6;
constexpr std::size_t kCOLLECTION = 7;
constexpr std::size_t kITEM_IDS = 8;
constexpr std::size_t kAMOUNTS = 9;
constexpr std::size_t kFEE_RECIPIENTS = 10;
constexpr std::size_t kFEE_AMOUNTS = 12;

model::NoncesCancelled
decodeNonces(model::RawLog const& log, bool isSubset)
{
    AbiReader const reader{log.data};
    return {
        .orderKind = model::OrderKind::LooksRareV2,
        .maker = reader.addressAt(0),
        .nonces = reader.uint256ArrayAt(1),
        .isSubset = isSubset,
    };
}

/**
 * @brief Decodes the layout both taker events share.
 *
 * @param log The raw log
 * @param side The side of the executed maker order
 * @param makerWord Head word holding the maker
 * @param takerWord Head word holding the taker
 */
model::TakerTrade
decodeTrade(model::RawLog const& log, model::OrderSide side, std::size_t makerWord, std::size_t takerWord)
{
    AbiReader const reader{log.data};

    model::TakerTrade trade{
        .orderKind = model::OrderKind::LooksRareV2,
        .orderSide = side,
        .orderId = reader.bytes32At(kORDER_HASH),
        .orderNonce = reader.uint256At(kORDER_NONCE),
        .isNonceInvalidated = reader.boolAt(kIS_NONCE_INVALIDATED),
        .maker = reader.addressAt(makerWord),
        .taker = reader.addressAt(takerWord),
        .strategyId = reader.uint256At(kSTRATEGY_ID),
        .currency = reader.addressAt(kCURRENCY),
        .collection = reader.addressAt(kCOLLECTION),
        .itemIds = reader.uint256ArrayAt(kITEM_IDS),
        .amounts = reader.uint256ArrayAt(kAMOUNTS),
        .feeRecipients = {reader.addressAt(kFEE_RECIPIENTS), reader.addressAt(kFEE_RECIPIENTS + 1)},
        .feeAmounts =
            {reader.uint256At(kFEE_AMOUNTS), reader.uint256At(kFEE_AMOUNTS + 1), reader.uint256At(kFEE_AMOUNTS + 2)},
    };

    if (trade.itemIds.empty())
        throw MalformedPayload("Trade without items");

    if (trade.itemIds.size() != trade.amounts.size()) {
        throw MalformedPayload(
            fmt::format("Trade has {} item ids but {} amounts", trade.itemIds.size(), trade.amounts.size())
        );
    }

    return trade;
}

}  // namespace

model::BidAskNonces
decodeNewBidAskNonces(model::RawLog const& log)
{
    AbiReader const reader{log.data};
    return {
        .orderKind = model::OrderKind::LooksRareV2,
        .maker = reader.addressAt(0),
        .bidNonce = reader.uint256At(1),
        .askNonce = reader.uint256At(2),
    };
}

model::NoncesCancelled
decodeSubsetNoncesCancelled(model::RawLog const& log)
{
    return decodeNonces(log, true);
}

model::NoncesCancelled
decodeOrderNoncesCancelled(model::RawLog const& log)
{
    return decodeNonces(log, false);
}

model::TakerTrade
decodeTakerAsk(model::RawLog const& log)
{
    // the ask user sells into a bid, so the executed maker order is a buy order
    return decodeTrade(log, model::OrderSide::Buy, kSECOND_USER, kFIRST_USER);
}

model::TakerTrade
decodeTakerBid(model::RawLog const& log)
{
    // the bid recipient takes a listing, so the executed maker order is a sell order
    return decodeTrade(log, model::OrderSide::Sell, kFIRST_USER, kSECOND_USER);
}

}  // namespace ingest::impl::looksrare_v2
