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

#include "app/SyncApplication.hpp"

#include "ingest/BatchRunner.hpp"
#include "ingest/DecodeError.hpp"
#include "ingest/ModelsJson.hpp"
#include "ingest/Normalization.hpp"
#include "ingest/impl/DecoderRegistry.hpp"
#include "ingest/impl/Erc20TransferScanner.hpp"
#include "ingest/impl/FixedRatePriceResolver.hpp"
#include "ingest/impl/NoAttributionResolver.hpp"
#include "ingest/impl/ResolverGuard.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>

namespace app {

SyncApplication::SyncApplication(util::config::ConfigDefinition const& config) : config_(config)
{
}

int
SyncApplication::run(std::string const& eventsPath)
{
    std::ifstream file{eventsPath};
    if (not file.is_open()) {
        LOG(util::LogService::error()) << "Could not open events file " << eventsPath;
        return EXIT_FAILURE;
    }

    std::string const contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    boost::system::error_code ec;
    auto const json = boost::json::parse(contents, ec);
    if (ec) {
        LOG(util::LogService::error()) << "Events file " << eventsPath << " is not JSON: " << ec.message();
        return EXIT_FAILURE;
    }

    auto const events = ingest::readRawEvents(json);
    if (not events.has_value()) {
        LOG(util::LogService::error()) << "Could not read events from " << eventsPath << ": " << events.error();
        return EXIT_FAILURE;
    }

    auto const workers = config_.get<std::uint16_t>("sync.workers");
    auto const resolverThreads = config_.get<std::uint16_t>("sync.resolver_threads");
    auto const priceTimeout = std::chrono::milliseconds{config_.get<std::uint32_t>("sync.price_timeout_ms")};
    auto const attributionTimeout =
        std::chrono::milliseconds{config_.get<std::uint32_t>("sync.attribution_timeout_ms")};

    LOG(util::LogService::info()) << "Normalizing " << events->size() << " events with " << workers
                                  << " workers and " << resolverThreads << " resolver threads";

    // Resolver calls run here so a stuck one can be abandoned after its timeout
    auto guard = std::make_shared<ingest::impl::ResolverGuard>(resolverThreads);

    auto fixedRates = std::make_shared<ingest::impl::FixedRatePriceResolver>(
        ingest::impl::FixedRatePriceResolver::fromConfig(config_)
    );
    auto prices = std::make_shared<ingest::impl::GuardedPriceResolver>(std::move(fixedRates), guard, priceTimeout);
    auto attribution = std::make_shared<ingest::impl::GuardedAttributionResolver>(
        std::make_shared<ingest::impl::NoAttributionResolver>(), guard, attributionTimeout
    );

    auto normalizer = ingest::makeNormalizer(
        ingest::impl::makeDecoderRegistry(),
        std::move(attribution),
        std::move(prices),
        std::make_shared<ingest::impl::Erc20TransferScanner const>()
    );

    ingest::BatchRunner runner{normalizer, workers};

    try {
        auto const data = runner.run(*events);
        std::cout << boost::json::serialize(boost::json::value_from(data)) << std::endl;
    } catch (ingest::DecoderRegistryUnavailable const& e) {
        LOG(util::LogService::error()) << "Normalization failed: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}  // namespace app
