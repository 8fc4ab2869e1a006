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

#include "ingest/Erc20TransferScannerInterface.hpp"
#include "ingest/Models.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ingest::impl {

/**
 * @brief Finds ERC-20 transfers by their event signature and topic count.
 *
 * ERC-721 uses the same `Transfer(address,address,uint256)` signature but indexes the token id, giving it four
 * topics instead of three.
 */
class Erc20TransferScanner : public Erc20TransferScannerInterface {
public:
    static constexpr std::string_view kTRANSFER_TOPIC =
        "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

    [[nodiscard]] std::optional<std::string>
    scan(std::vector<model::RawLog> const& logs) const override;
};

}  // namespace ingest::impl
