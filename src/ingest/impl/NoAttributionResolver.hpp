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
#include "ingest/Models.hpp"

#include <string>

namespace ingest::impl {

/**
 * @brief Attribution resolver for offline runs. Never credits anyone and never overrides the taker.
 */
class NoAttributionResolver : public AttributionResolverInterface {
public:
    [[nodiscard]] model::Attribution
    resolve(
        [[maybe_unused]] std::string const& txHash,
        [[maybe_unused]] model::OrderKind orderKind,
        [[maybe_unused]] model::OrderRef const& order
    ) override
    {
        return {};
    }
};

}  // namespace ingest::impl
