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

#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>

#include <expected>
#include <string>
#include <vector>

namespace ingest::model {

// Big integers are written as decimal strings. Keys are snake_case.

OriginParams
tag_invoke(boost::json::value_to_tag<OriginParams>, boost::json::value const& jv);

RawLog
tag_invoke(boost::json::value_to_tag<RawLog>, boost::json::value const& jv);

/**
 * Unknown kind tags are read as `EventKind::Other` and kept in `otherKind`.
 *
 * @throws std::invalid_argument if the log data is not hex
 */
RawEvent
tag_invoke(boost::json::value_to_tag<RawEvent>, boost::json::value const& jv);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, OriginParams const& origin);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, RawLog const& log);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, RawEvent const& event);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, FillEvent const& fill);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, NonceCancelEvent const& cancel);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, BulkCancelEvent const& cancel);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, Trigger const& trigger);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, OrderInfo const& info);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, FillInfo const& info);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, MakerInfo const& info);

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, OnChainData const& data);

}  // namespace ingest::model

namespace ingest {

/**
 * @brief Read a batch of raw events from a JSON array.
 *
 * Events of kinds this build doesn't know are kept as `EventKind::Other` so their logs reach the log cache.
 *
 * @param json The array
 * @return The events on success; a description of the first bad entry otherwise
 */
[[nodiscard]] std::expected<std::vector<model::RawEvent>, std::string>
readRawEvents(boost::json::value const& json);

}  // namespace ingest
