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

#pragma once

#include "ingest/AttributionResolverInterface.hpp"
#include "ingest/Erc20TransferScannerInterface.hpp"
#include "ingest/Models.hpp"
#include "ingest/PriceResolverInterface.hpp"
#include "ingest/RegistryInterface.hpp"
#include "util/log/Logger.hpp"

#include <memory>

namespace ingest::ext {

/**
 * @brief Settles a taker executing a maker's order.
 *
 * A settled trade yields, in order:
 * - the fill
 * - a cancel of the maker's nonce, which other orders of the maker may share
 * - an order status trigger marking the order filled
 * - the fill projection used by statistics
 * - a maker approval resync, only if the transaction moved ERC-20 tokens
 *
 * Bundles are skipped without a trace. A trade that can't be priced in the native currency yields nothing.
 *
 * @note The resolvers are expected to never throw; wrap them with the guarded resolvers.
 */
class TradeExecution {
    util::Logger log_{"Sync"};
    std::shared_ptr<AttributionResolverInterface> attribution_;
    std::shared_ptr<PriceResolverInterface> prices_;
    std::shared_ptr<Erc20TransferScannerInterface const> scanner_;

public:
    using spec = model::Spec<model::EventKind::LooksRareV2TakerAsk, model::EventKind::LooksRareV2TakerBid>;

    TradeExecution(
        std::shared_ptr<AttributionResolverInterface> attribution,
        std::shared_ptr<PriceResolverInterface> prices,
        std::shared_ptr<Erc20TransferScannerInterface const> scanner
    );

    void
    onEvent(EventContext& ctx, model::TakerTrade const& trade) const;
};

}  // namespace ingest::ext
