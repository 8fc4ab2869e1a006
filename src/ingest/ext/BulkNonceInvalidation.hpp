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
#include "ingest/RegistryInterface.hpp"

namespace ingest::ext {

/**
 * @brief Settles bulk nonce increases.
 *
 * Raising both nonces of a maker invalidates every ask and every bid below the new values, so one raw event yields a
 * sell side cancel followed by a buy side cancel, both across all collections. They get consecutive batch indices
 * starting from the raw event's own.
 */
class BulkNonceInvalidation {
public:
    using spec = model::Spec<model::EventKind::LooksRareV2NewBidAskNonces>;

    void
    onEvent(EventContext& ctx, model::BidAskNonces const& nonces) const;
};

}  // namespace ingest::ext
