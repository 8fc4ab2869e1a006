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
#include "ingest/Stats.hpp"

#include <vector>

namespace ingest {

/**
 * @brief Turns an ordered batch of raw events into canonical records.
 */
struct NormalizerInterface {
    virtual ~NormalizerInterface() = default;

    /**
     * @brief Normalize a batch.
     *
     * Events must be in chain order (block, transaction, log index). Records are only ever appended to the
     * accumulator. Problems with a single event never abort the batch.
     *
     * @param events The raw events
     * @param out The accumulator to append to
     * @throws DecoderRegistryUnavailable if no event can be decoded at all
     */
    virtual void
    normalize(std::vector<model::RawEvent> const& events, model::OnChainData& out) = 0;

    /**
     * @return The counters accumulated over all batches so far
     */
    [[nodiscard]] virtual Statistics
    statistics() const = 0;
};

}  // namespace ingest
