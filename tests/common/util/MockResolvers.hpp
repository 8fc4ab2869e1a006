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

#include "ingest/AttributionResolverInterface.hpp"
#include "ingest/Erc20TransferScannerInterface.hpp"
#include "ingest/Models.hpp"
#include "ingest/PriceResolverInterface.hpp"

#include <gmock/gmock.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct MockAttributionResolver : ingest::AttributionResolverInterface {
    MOCK_METHOD(
        ingest::model::Attribution,
        resolve,
        (std::string const&, ingest::model::OrderKind, ingest::model::OrderRef const&),
        (override)
    );
};

struct MockPriceResolver : ingest::PriceResolverInterface {
    MOCK_METHOD(
        ingest::model::Prices,
        resolve,
        (std::string const&, ingest::model::Amount const&, std::uint64_t),
        (override)
    );
};

struct MockErc20TransferScanner : ingest::Erc20TransferScannerInterface {
    MOCK_METHOD(std::optional<std::string>, scan, (std::vector<ingest::model::RawLog> const&), (const, override));
};
