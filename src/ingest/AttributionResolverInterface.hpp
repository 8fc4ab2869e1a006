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

#include <string>

namespace ingest {

/**
 * @brief Works out who actually took an order and which marketplace, aggregator or referrer gets the credit.
 *
 * Implementations typically look at the whole transaction (calldata, other logs) and may hit the network.
 * They are allowed to throw; callers guard every call.
 */
struct AttributionResolverInterface {
    virtual ~AttributionResolverInterface() = default;

    /**
     * @brief Resolve attribution for a single fill.
     *
     * @param txHash The transaction the fill happened in
     * @param orderKind The protocol of the filled order
     * @param order The filled order
     * @return The attribution; any field may be missing
     */
    [[nodiscard]] virtual model::Attribution
    resolve(std::string const& txHash, model::OrderKind orderKind, model::OrderRef const& order) = 0;
};

}  // namespace ingest
