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

#include "ingest/impl/FixedRatePriceResolver.hpp"

#include "ingest/Models.hpp"
#include "util/Hex.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace ingest::impl {

namespace {

// amount * ppm can need up to 320 bits
std::optional<model::Amount>
convert(model::Amount const& amount, std::uint64_t ppm)
{
    using boost::multiprecision::uint512_t;

    uint512_t const converted = uint512_t{amount} * ppm / FixedRatePriceResolver::kPPM;
    if ((converted >> 256) != 0)
        return std::nullopt;

    return static_cast<model::Amount>(converted);
}

}  // namespace

FixedRatePriceResolver::FixedRatePriceResolver(std::map<std::string, Rate> rates)
{
    for (auto& [currency, rate] : rates)
        rates_.insert_or_assign(util::toLowerHex(currency), rate);
}

FixedRatePriceResolver
FixedRatePriceResolver::fromConfig(util::config::ConfigDefinition const& config)
{
    std::map<std::string, Rate> rates;
    for (auto const& entry : config.getArray("prices")) {
        auto const usd = entry.maybeValue<std::int64_t>("usd_rate_ppm");
        rates.insert_or_assign(
            entry.get<std::string>("currency"),
            Rate{
                .nativePpm = static_cast<std::uint64_t>(entry.get<std::int64_t>("native_rate_ppm")),
                .usdPpm = usd ? std::make_optional(static_cast<std::uint64_t>(*usd)) : std::nullopt,
            }
        );
    }

    return FixedRatePriceResolver{std::move(rates)};
}

model::Prices
FixedRatePriceResolver::resolve(
    std::string const& currency,
    model::Amount const& amount,
    [[maybe_unused]] std::uint64_t timestamp
)
{
    auto const it = rates_.find(util::toLowerHex(currency));
    if (it == rates_.end())
        return {};

    auto const& rate = it->second;
    auto const native = convert(amount, rate.nativePpm);
    if (not native.has_value()) {
        LOG(log_.warn()) << "Native price of " << amount << " " << currency << " does not fit in 256 bits";
        return {};
    }

    model::Prices prices{.nativePrice = native, .usdPrice = std::nullopt};
    if (rate.usdPpm.has_value()) {
        prices.usdPrice = convert(amount, *rate.usdPpm);
        if (not prices.usdPrice.has_value())
            LOG(log_.warn()) << "USD price of " << amount << " " << currency << " does not fit in 256 bits";
    }

    return prices;
}

}  // namespace ingest::impl
