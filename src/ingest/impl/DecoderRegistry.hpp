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
#include "ingest/DecoderRegistryInterface.hpp"
#include "ingest/Models.hpp"
#include "util/log/Logger.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>

namespace ingest::impl {

/**
 * @brief Decoder registry backed by a table of decoding functions, one per event kind.
 */
class DecoderRegistry : public DecoderRegistryInterface {
public:
    using DecoderType = std::function<model::DecodedEvent(model::RawLog const&)>;

private:
    util::Logger log_{"Sync"};
    std::map<model::EventKind, DecoderType> decoders_;

public:
    DecoderRegistry() = default;

    explicit DecoderRegistry(std::map<model::EventKind, DecoderType> decoders);

    /**
     * @brief Register or replace the decoder of a kind.
     *
     * @param kind The event kind
     * @param decoder The decoder; throws MalformedPayload for logs it can't read
     */
    void
    add(model::EventKind kind, DecoderType decoder);

    [[nodiscard]] std::expected<model::DecodedEvent, DecodeError>
    decode(model::EventKind kind, model::RawLog const& log) const override;

    [[nodiscard]] bool
    isAvailable() const override;
};

/**
 * @brief Build the registry with decoders for every supported marketplace event.
 *
 * @return The registry
 */
[[nodiscard]] std::shared_ptr<DecoderRegistry>
makeDecoderRegistry();

}  // namespace ingest::impl
