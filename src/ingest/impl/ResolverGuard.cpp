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

#include "ingest/impl/ResolverGuard.hpp"

#include "ingest/AttributionResolverInterface.hpp"
#include "ingest/Models.hpp"
#include "ingest/PriceResolverInterface.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace ingest::impl {

GuardedAttributionResolver::GuardedAttributionResolver(
    std::shared_ptr<AttributionResolverInterface> resolver,
    std::shared_ptr<ResolverGuard> guard,
    std::chrono::milliseconds timeout
)
    : resolver_{std::move(resolver)}, guard_{std::move(guard)}, timeout_{timeout}
{
}

model::Attribution
GuardedAttributionResolver::resolve(std::string const& txHash, model::OrderKind orderKind, model::OrderRef const& order)
{
    auto result = guard_->run(
        [resolver = resolver_, txHash, orderKind, order] { return resolver->resolve(txHash, orderKind, order); },
        timeout_
    );

    if (not result.has_value()) {
        LOG(log_.warn()) << "No attribution for order " << order.orderId << " in " << txHash << ": "
                         << result.error();
        return {};
    }

    return std::move(result).value();
}

GuardedPriceResolver::GuardedPriceResolver(
    std::shared_ptr<PriceResolverInterface> resolver,
    std::shared_ptr<ResolverGuard> guard,
    std::chrono::milliseconds timeout
)
    : resolver_{std::move(resolver)}, guard_{std::move(guard)}, timeout_{timeout}
{
}

model::Prices
GuardedPriceResolver::resolve(std::string const& currency, model::Amount const& amount, std::uint64_t timestamp)
{
    auto result = guard_->run(
        [resolver = resolver_, currency, amount, timestamp] { return resolver->resolve(currency, amount, timestamp); },
        timeout_
    );

    if (not result.has_value()) {
        LOG(log_.warn()) << "No price for " << amount.str() << " of " << currency << " at " << timestamp << ": "
                         << result.error();
        return {};
    }

    return std::move(result).value();
}

}  // namespace ingest::impl
