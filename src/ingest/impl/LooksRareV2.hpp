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

namespace ingest::impl::looksrare_v2 {

// All decoders throw MalformedPayload when the log's data does not match the event's layout.

/**
 * @brief Decode `NewBidAskNonces(address user, uint256 bidNonce, uint256 askNonce)`.
 */
[[nodiscard]] model::BidAskNonces
decodeNewBidAskNonces(model::RawLog const& log);

/**
 * @brief Decode `SubsetNoncesCancelled(address user, uint256[] subsetNonces)`.
 */
[[nodiscard]] model::NoncesCancelled
decodeSubsetNoncesCancelled(model::RawLog const& log);

/**
 * @brief Decode `OrderNoncesCancelled(address user, uint256[] orderNonces)`.
 */
[[nodiscard]] model::NoncesCancelled
decodeOrderNoncesCancelled(model::RawLog const& log);

/**
 * @brief Decode `TakerAsk`. The maker is the bid user; the taker is the ask user.
 */
[[nodiscard]] model::TakerTrade
decodeTakerAsk(model::RawLog const& log);

/**
 * @brief Decode `TakerBid`. The maker is the bid user; the taker is the bid recipient.
 */
[[nodiscard]] model::TakerTrade
decodeTakerBid(model::RawLog const& log);

}  // namespace ingest::impl::looksrare_v2
