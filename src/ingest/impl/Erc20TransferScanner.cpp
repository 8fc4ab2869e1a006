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

#include "ingest/impl/Erc20TransferScanner.hpp"

#include "ingest/Models.hpp"
#include "util/Hex.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ingest::impl {

namespace {

constexpr std::size_t kERC20_TRANSFER_TOPICS = 3;

}  // namespace

std::optional<std::string>
Erc20TransferScanner::scan(std::vector<model::RawLog> const& logs) const
{
    for (auto const& log : logs) {
        if (log.topics.size() == kERC20_TRANSFER_TOPICS and util::toLowerHex(log.topics.front()) == kTRANSFER_TOPIC)
            return util::toLowerHex(log.address);
    }

    return std::nullopt;
}

}  // namespace ingest::impl
