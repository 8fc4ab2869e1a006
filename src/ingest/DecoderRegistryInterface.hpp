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

#include "ingest/DecodeError.hpp"
#include "ingest/Models.hpp"

#include <expected>

namespace ingest {

/**
 * @brief Turns a raw log of a known kind into a decoded event.
 */
struct DecoderRegistryInterface {
    virtual ~DecoderRegistryInterface() = default;

    /**
     * @brief Decode a log.
     *
     * @param kind The event kind the log was classified as
     * @param log The raw log
     * @return The decoded event on success; the reason it can't be decoded otherwise
     */
    [[nodiscard]] virtual std::expected<model::DecodedEvent, DecodeError>
    decode(model::EventKind kind, model::RawLog const& log) const = 0;

    /**
     * @return true if at least one decoder is registered; false otherwise
     */
    [[nodiscard]] virtual bool
    isAvailable() const = 0;
};

}  // namespace ingest
