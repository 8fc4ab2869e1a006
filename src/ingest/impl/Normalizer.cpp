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

#include "ingest/impl/Normalizer.hpp"

#include "ingest/DecodeError.hpp"
#include "ingest/DecoderRegistryInterface.hpp"
#include "ingest/Models.hpp"
#include "ingest/RegistryInterface.hpp"
#include "ingest/Stats.hpp"
#include "ingest/impl/TxLogCache.hpp"
#include "util/Assert.hpp"
#include "util/log/Logger.hpp"

#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace ingest::impl {

Normalizer::Normalizer(std::shared_ptr<DecoderRegistryInterface> decoders, std::shared_ptr<RegistryInterface> registry)
    : decoders_{std::move(decoders)}, registry_{std::move(registry)}
{
    ASSERT(registry_ != nullptr, "Rule registry must be set");
}

void
Normalizer::normalize(std::vector<model::RawEvent> const& events, model::OnChainData& out)
{
    if (decoders_ == nullptr or not decoders_->isAvailable())
        throw DecoderRegistryUnavailable("Decoder registry is not available");

    LOG(log_.trace()) << "Normalizing " << events.size() << " events";

    TxLogCache cache;
    for (auto const& event : events)
        normalizeOne(event, cache.push(event), out);
}

Statistics
Normalizer::statistics() const
{
    return stats_.snapshot();
}

void
Normalizer::normalizeOne(
    model::RawEvent const& event,
    std::vector<model::RawLog> const& txLogs,
    model::OnChainData& out
)
{
    stats_.event();

    if (not registry_->handles(event.kind)) {
        LOG(log_.trace()) << "No rule for " << model::toString(event.kind) << ", ignoring";
        stats_.ignoredKind();
        return;
    }

    auto decoded = decoders_->decode(event.kind, event.log);
    if (not decoded.has_value()) {
        if (decoded.error().code == DecodeError::Code::RegistryUnavailable)
            throw DecoderRegistryUnavailable(decoded.error().message);

        LOG(log_.error()) << "Could not decode " << model::toString(event.kind) << " in " << event.origin.txHash
                          << " at log " << event.origin.logIndex << ": " << decoded.error().message;
        stats_.decodeError();
        return;
    }

    model::OnChainData staged;
    EventContext ctx{.event = event, .txLogs = txLogs, .out = staged, .stats = stats_};

    try {
        registry_->dispatch(ctx, *decoded);
    } catch (std::exception const& e) {
        LOG(log_.error()) << "Failed settling " << model::toString(event.kind) << " in " << event.origin.txHash
                          << " at log " << event.origin.logIndex << ": " << e.what();
        return;
    }

    stats_.records(staged.size());
    out.append(std::move(staged));
}

}  // namespace ingest::impl
