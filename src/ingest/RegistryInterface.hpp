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
 * @brief Everything a rule gets to see while settling one raw event.
 */
struct EventContext {
    model::RawEvent const& event;
    std::vector<model::RawLog> const& txLogs;  // logs of the current transaction up to and including this event
    model::OnChainData& out;
    Stats& stats;
};

/**
 * @brief The interface for a registry that dispatches decoded events to rules.
 *
 * @note
 * The registry itself consists of rules. Each rule defines a spec listing the event kinds it settles and one or more
 * hooks taking the decoded shapes it understands:
 * - void onEvent(ingest::EventContext&, ingest::model::BidAskNonces const&)
 * - void onEvent(ingest::EventContext&, ingest::model::NoncesCancelled const&)
 * - void onEvent(ingest::EventContext&, ingest::model::TakerTrade const&)
 *
 * A decoded event is handed to every registered rule whose spec wants the raw event's kind and which has a hook for
 * the decoded shape, in the order the rules were registered.
 *
 * A rule's spec is set up like so:
 * @code{.cpp}
 * struct Rule {
 *   using spec = ingest::model::Spec<
 *     ingest::model::EventKind::LooksRareV2TakerAsk,
 *     ingest::model::EventKind::LooksRareV2TakerBid>;
 *
 *   void
 *   onEvent(ingest::EventContext& ctx, ingest::model::TakerTrade const& trade);
 * };
 * @endcode
 */
struct RegistryInterface {
    virtual ~RegistryInterface() = default;

    /**
     * @brief Check whether any registered rule settles the given kind.
     *
     * @param kind The event kind
     * @return true if some rule wants the kind; false otherwise
     */
    [[nodiscard]] virtual bool
    handles(model::EventKind kind) const = 0;

    /**
     * @brief Dispatch a decoded event to the rules.
     *
     * @param ctx The context of the raw event
     * @param decoded The decoded event
     */
    virtual void
    dispatch(EventContext& ctx, model::DecodedEvent const& decoded) = 0;
};

}  // namespace ingest
