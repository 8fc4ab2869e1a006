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

namespace ingest {

/**
 * @brief Finds an ERC-20 transfer among the logs of a transaction.
 */
struct Erc20TransferScannerInterface {
    virtual ~Erc20TransferScannerInterface() = default;

    /**
     * @brief Scan logs for an ERC-20 transfer.
     *
     * @param logs The logs seen so far in the transaction
     * @return The contract of the first transferred token; std::nullopt if there is no transfer
     */
    [[nodiscard]] virtual std::optional<std::string>
    scan(std::vector<model::RawLog> const& logs) const = 0;
};

}  // namespace ingest
