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

#include <cstdint>
#include <string>

namespace ingest {

/**
 * @brief Converts an amount of some currency into native and usd prices at a point in time.
 *
 * Implementations may throw; callers guard every call.
 */
struct PriceResolverInterface {
    virtual ~PriceResolverInterface() = default;

    /**
     * @brief Resolve the prices of an amount.
     *
     * @param currency The currency contract
     * @param amount The amount, in the currency's smallest unit
     * @param timestamp Unix time the prices should be valid at
     * @return The prices; an empty native price means the amount can't be priced
     */
    [[nodiscard]] virtual model::Prices
    resolve(std::string const& currency, model::Amount const& amount, std::uint64_t timestamp) = 0;
};

}  // namespace ingest
