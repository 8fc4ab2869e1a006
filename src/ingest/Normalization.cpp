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

#include "ingest/Normalization.hpp"

#include "ingest/AttributionResolverInterface.hpp"
#include "ingest/DecoderRegistryInterface.hpp"
#include "ingest/Erc20TransferScannerInterface.hpp"
#include "ingest/NormalizerInterface.hpp"
#include "ingest/PriceResolverInterface.hpp"
#include "ingest/RegistryInterface.hpp"
#include "ingest/ext/BulkNonceInvalidation.hpp"
#include "ingest/ext/NonceCancellation.hpp"
#include "ingest/ext/TradeExecution.hpp"
#include "ingest/impl/Normalizer.hpp"
#include "ingest/impl/Registry.hpp"

#include <memory>
#include <utility>

namespace ingest {

std::shared_ptr<RegistryInterface>
makeRuleRegistry(
    std::shared_ptr<AttributionResolverInterface> attribution,
    std::shared_ptr<PriceResolverInterface> prices,
    std::shared_ptr<Erc20TransferScannerInterface const> scanner
)
{
    using RegistryType = impl::Registry<ext::BulkNonceInvalidation, ext::NonceCancellation, ext::TradeExecution>;

    return std::make_shared<RegistryType>(
        ext::BulkNonceInvalidation{},
        ext::NonceCancellation{},
        ext::TradeExecution{std::move(attribution), std::move(prices), std::move(scanner)}
    );
}

std::shared_ptr<NormalizerInterface>
makeNormalizer(
    std::shared_ptr<DecoderRegistryInterface> decoders,
    std::shared_ptr<AttributionResolverInterface> attribution,
    std::shared_ptr<PriceResolverInterface> prices,
    std::shared_ptr<Erc20TransferScannerInterface const> scanner
)
{
    return std::make_shared<impl::Normalizer>(
        std::move(decoders), makeRuleRegistry(std::move(attribution), std::move(prices), std::move(scanner))
    );
}

}  // namespace ingest
