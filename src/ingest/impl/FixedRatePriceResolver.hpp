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

#include "ingest/Models.hpp"
#include "ingest/PriceResolverInterface.hpp"
#include "util/log/Logger.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace util::config {
class ConfigDefinition;
}  // namespace util::config

namespace ingest::impl {

/**
 * @brief Prices currencies with constant rates, given in parts per million of the native and usd units.
 *
 * Currencies without a rate can't be priced. Neither can amounts whose converted price does not fit in 256 bits.
 */
class FixedRatePriceResolver : public PriceResolverInterface {
public:
    struct Rate {
        std::uint64_t nativePpm = 0;
        std::optional<std::uint64_t> usdPpm;
    };

    static constexpr std::uint64_t kPPM = 1'000'000;

private:
    util::Logger log_{"Resolver"};
    std::map<std::string, Rate> rates_;

public:
    /**
     * @brief Construct from a table of rates.
     *
     * @param rates Rates keyed by currency contract; keys are matched case-insensitively
     */
    explicit FixedRatePriceResolver(std::map<std::string, Rate> rates);

    /**
     * @brief Construct from the `prices` array of the config.
     *
     * @param config The parsed config
     * @return The resolver
     */
    [[nodiscard]] static FixedRatePriceResolver
    fromConfig(util::config::ConfigDefinition const& config);

    [[nodiscard]] model::Prices
    resolve(std::string const& currency, model::Amount const& amount, std::uint64_t timestamp) override;
};

}  // namespace ingest::impl
