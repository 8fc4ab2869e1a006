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

#include "ingest/impl/DecoderRegistry.hpp"

#include "ingest/DecodeError.hpp"
#include "ingest/Models.hpp"
#include "ingest/impl/AbiReader.hpp"
#include "ingest/impl/LooksRareV2.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <expected>
#include <map>
#include <memory>
#include <utility>

namespace ingest::impl {

DecoderRegistry::DecoderRegistry(std::map<model::EventKind, DecoderType> decoders) : decoders_{std::move(decoders)}
{
}

void
DecoderRegistry::add(model::EventKind kind, DecoderType decoder)
{
    decoders_.insert_or_assign(kind, std::move(decoder));
}

std::expected<model::DecodedEvent, DecodeError>
DecoderRegistry::decode(model::EventKind kind, model::RawLog const& log) const
{
    if (decoders_.empty())
        return std::unexpected{DecodeError{DecodeError::Code::RegistryUnavailable, "No decoders registered"}};

    auto const it = decoders_.find(kind);
    if (it == decoders_.end()) {
        return std::unexpected{
            DecodeError{DecodeError::Code::UnknownKind, fmt::format("No decoder for {}", model::toString(kind))}
        };
    }

    try {
        return it->second(log);
    } catch (MalformedPayload const& e) {
        LOG(log_.trace()) << "Failed decoding " << model::toString(kind) << ": " << e.what();
        return std::unexpected{DecodeError{DecodeError::Code::Malformed, e.what()}};
    }
}

bool
DecoderRegistry::isAvailable() const
{
    return not decoders_.empty();
}

std::shared_ptr<DecoderRegistry>
makeDecoderRegistry()
{
    using model::EventKind;
    namespace lr = looksrare_v2;

    return std::make_shared<DecoderRegistry>(std::map<EventKind, DecoderRegistry::DecoderType>{
        {EventKind::LooksRareV2NewBidAskNonces, lr::decodeNewBidAskNonces},
        {EventKind::LooksRareV2SubsetNoncesCancelled, lr::decodeSubsetNoncesCancelled},
        {EventKind::LooksRareV2OrderNoncesCancelled, lr::decodeOrderNoncesCancelled},
        {EventKind::LooksRareV2TakerAsk, lr::decodeTakerAsk},
        {EventKind::LooksRareV2TakerBid, lr::decodeTakerBid},
    });
}

}  // namespace ingest::impl
