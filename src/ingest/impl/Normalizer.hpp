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

#include "ingest/DecoderRegistryInterface.hpp"
#include "ingest/Models.hpp"
#include "ingest/NormalizerInterface.hpp"
#include "ingest/RegistryInterface.hpp"
#include "ingest/Stats.hpp"
#include "util/log/Logger.hpp"

#include <memory>
#include <vector>

namespace ingest::impl {

/**
 * @brief Decodes raw events and hands them to the rules of a registry.
 *
 * The records a rule emits for one raw event are staged and only appended once the rule finished, so a failing rule
 * never leaves half of its records behind. Calls on the same instance may run concurrently as long as the rules and
 * the decoder registry allow it.
 */
class Normalizer : public NormalizerInterface {
    util::Logger log_{"Sync"};
    std::shared_ptr<DecoderRegistryInterface> decoders_;
    std::shared_ptr<RegistryInterface> registry_;
    Stats stats_;

public:
    Normalizer(std::shared_ptr<DecoderRegistryInterface> decoders, std::shared_ptr<RegistryInterface> registry);

    void
    normalize(std::vector<model::RawEvent> const& events, model::OnChainData& out) override;

    [[nodiscard]] Statistics
    statistics() const override;

private:
    void
    normalizeOne(model::RawEvent const& event, std::vector<model::RawLog> const& txLogs, model::OnChainData& out);
};

}  // namespace ingest::impl
