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

#include <optional>
#include <string>
#include <vector>

namespace ingest::impl {

/**
 * @brief The logs of the transaction currently being normalized.
 */
class TxLogCache {
    std::optional<std::string> txHash_;
    std::vector<model::RawLog> logs_;

public:
    /**
     * @brief Add the log of an event, starting over if the event belongs to another transaction than the previous.
     *
     * @param event The raw event
     * @return The logs of the event's transaction seen so far, including the event's own
     */
    std::vector<model::RawLog> const&
    push(model::RawEvent const& event)
    {
        if (txHash_ != event.origin.txHash) {
            txHash_ = event.origin.txHash;
            logs_.clear();
        }

        logs_.push_back(event.log);
        return logs_;
    }

    [[nodiscard]] std::vector<model::RawLog> const&
    logs() const
    {
        return logs_;
    }
};

}  // namespace ingest::impl
