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

#include "ingest/ext/TradeExecution.hpp"

#include "ingest/AttributionResolverInterface.hpp"
#include "ingest/Erc20TransferScannerInterface.hpp"
#include "ingest/Models.hpp"
#include "ingest/PriceResolverInterface.hpp"
#include "ingest/RegistryInterface.hpp"
#include "util/Assert.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace ingest::ext {

namespace {

std::optional<std::int64_t>
sourceId(std::optional<model::Source> const& source)
{
    if (source.has_value())
        return source->id;
    return std::nullopt;
}

}  // namespace

TradeExecution::TradeExecution(
    std::shared_ptr<AttributionResolverInterface> attribution,
    std::shared_ptr<PriceResolverInterface> prices,
    std::shared_ptr<Erc20TransferScannerInterface const> scanner
)
    : attribution_{std::move(attribution)}, prices_{std::move(prices)}, scanner_{std::move(scanner)}
{
    ASSERT(attribution_ != nullptr, "Attribution resolver must be set");
    ASSERT(prices_ != nullptr, "Price resolver must be set");
    ASSERT(scanner_ != nullptr, "ERC-20 transfer scanner must be set");
}

void
TradeExecution::onEvent(EventContext& ctx, model::TakerTrade const& trade) const
{
    auto const& origin = ctx.event.origin;

    if (trade.itemIds.size() > 1) {
        ctx.stats.bundleSkip();
        return;
    }

    auto const& amount = trade.amounts.front();
    if (amount == 0) {
        LOG(log_.warn()) << "Data quality: zero amount for order " << trade.orderId << " in " << origin.txHash
                         << " at log " << origin.logIndex << ", skipping";
        ctx.stats.dataQualitySkip();
        return;
    }

    auto taker = trade.taker;
    auto const attribution = attribution_->resolve(origin.txHash, trade.orderKind, {.orderId = trade.orderId});
    if (attribution.taker.has_value())
        taker = *attribution.taker;

    model::Amount const currencyPrice = trade.feeAmounts.front() / amount;
    auto const prices = prices_->resolve(trade.currency, currencyPrice, origin.timestamp);
    if (not prices.nativePrice.has_value()) {
        LOG(log_.debug()) << "No native price for " << trade.currency << " in " << origin.txHash << " at log "
                          << origin.logIndex << ", dropping fill of " << trade.orderId;
        ctx.stats.missingPrice();
        return;
    }

    auto const tokenId = trade.itemIds.front().str();
    auto const amountStr = amount.str();

    ctx.out.fillEvents.push_back({
        .orderKind = trade.orderKind,
        .orderId = trade.orderId,
        .orderSide = trade.orderSide,
        .maker = trade.maker,
        .taker = taker,
        .price = *prices.nativePrice,
        .currency = trade.currency,
        .currencyPrice = currencyPrice,
        .usdPrice = prices.usdPrice,
        .contract = trade.collection,
        .tokenId = tokenId,
        .amount = amountStr,
        .orderSourceId = sourceId(attribution.orderSource),
        .aggregatorSourceId = sourceId(attribution.aggregatorSource),
        .fillSourceId = sourceId(attribution.fillSource),
        .origin = origin,
    });

    ctx.out.nonceCancelEvents.push_back({
        .orderKind = trade.orderKind,
        .maker = trade.maker,
        .nonce = trade.orderNonce,
        .isSubset = false,
        .origin = origin,
    });

    ctx.out.orderInfos.push_back({
        .context = fmt::format("filled-{}", trade.orderId),
        .orderId = trade.orderId,
        .trigger = {.kind = model::TriggerKind::Sale, .txHash = origin.txHash, .txTimestamp = origin.timestamp},
    });

    ctx.out.fillInfos.push_back({
        .context = trade.orderId,
        .orderId = trade.orderId,
        .orderSide = trade.orderSide,
        .contract = trade.collection,
        .tokenId = tokenId,
        .amount = amountStr,
        .price = *prices.nativePrice,
        .timestamp = origin.timestamp,
        .maker = trade.maker,
        .taker = taker,
    });

    // tokens moved on behalf of the maker change its allowance
    if (auto const erc20 = scanner_->scan(ctx.txLogs); erc20.has_value()) {
        ctx.out.makerInfos.push_back({
            .context = fmt::format("{}-buy-approval", origin.txHash),
            .maker = trade.maker,
            .trigger =
                {.kind = model::TriggerKind::ApprovalChange, .txHash = origin.txHash, .txTimestamp = origin.timestamp},
            .data = {.kind = model::ApprovalKind::BuyApproval, .contract = *erc20, .orderKind = trade.orderKind},
        });
    }
}

}  // namespace ingest::ext
