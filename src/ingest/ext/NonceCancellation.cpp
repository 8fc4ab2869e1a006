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

#include "ingest/ext/NonceCancellation.hpp"

#include "ingest/Models.hpp"
#include "ingest/RegistryInterface.hpp"

#include <cstdint>
#include <utility>

namespace ingest::ext {

void
NonceCancellation::onEvent(EventContext& ctx, model::NoncesCancelled const& cancelled) const
{
    std::uint32_t batchIndex = 1;
    for (auto const& nonce : cancelled.nonces) {
        auto origin = ctx.event.origin;
        origin.batchIndex = batchIndex++;

        ctx.out.nonceCancelEvents.push_back({
            .orderKind = cancelled.orderKind,
            .maker = cancelled.maker,
            .nonce = nonce,
            .isSubset = cancelled.isSubset,
            .origin = std::move(origin),
        });
    }
}

}  // namespace ingest::ext
