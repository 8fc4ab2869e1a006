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
#include "ingest/Models.hpp"
#include "ingest/PriceResolverInterface.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace ingest::impl {

/**
 * @brief Runs resolver calls on a dedicated thread pool and gives up on them after a timeout.
 *
 * A call that times out keeps running in the background; its result is dropped. Everything the call needs must be
 * captured by value. Destruction drops calls that have not started yet but waits for the ones already running, so a
 * wrapped resolver must return eventually, e.g. by bounding its own network I/O.
 */
class ResolverGuard {
    boost::asio::thread_pool pool_;

public:
    explicit ResolverGuard(std::size_t numThreads) : pool_{numThreads}
    {
    }

    ~ResolverGuard()
    {
        pool_.stop();
        pool_.join();
    }

    ResolverGuard(ResolverGuard const&) = delete;
    ResolverGuard&
    operator=(ResolverGuard const&) = delete;

    /**
     * @brief Run a function and wait for its result at most the given time.
     *
     * @param fn The function to run
     * @param timeout How long to wait
     * @return The result of the function; a description of the failure if it threw or timed out
     */
    template <typename FnType>
    [[nodiscard]] std::expected<std::invoke_result_t<FnType>, std::string>
    run(FnType&& fn, std::chrono::milliseconds timeout)
    {
        using ResultType = std::invoke_result_t<FnType>;

        auto task = std::make_shared<std::packaged_task<ResultType()>>(std::forward<FnType>(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task = std::move(task)] { (*task)(); });

        if (future.wait_for(timeout) != std::future_status::ready)
            return std::unexpected{fmt::format("timed out after {}ms", timeout.count())};

        try {
            return future.get();
        } catch (std::exception const& e) {
            return std::unexpected{std::string{e.what()}};
        }
    }
};

/**
 * @brief Attribution resolver that never fails: errors and timeouts mean no attribution.
 */
class GuardedAttributionResolver : public AttributionResolverInterface {
    util::Logger log_{"Resolver"};
    std::shared_ptr<AttributionResolverInterface> resolver_;
    std::shared_ptr<ResolverGuard> guard_;
    std::chrono::milliseconds timeout_;

public:
    GuardedAttributionResolver(
        std::shared_ptr<AttributionResolverInterface> resolver,
        std::shared_ptr<ResolverGuard> guard,
        std::chrono::milliseconds timeout
    );

    [[nodiscard]] model::Attribution
    resolve(std::string const& txHash, model::OrderKind orderKind, model::OrderRef const& order) override;
};

/**
 * @brief Price resolver that never fails: errors and timeouts mean no prices.
 */
class GuardedPriceResolver : public PriceResolverInterface {
    util::Logger log_{"Resolver"};
    std::shared_ptr<PriceResolverInterface> resolver_;
    std::shared_ptr<ResolverGuard> guard_;
    std::chrono::milliseconds timeout_;

public:
    GuardedPriceResolver(
        std::shared_ptr<PriceResolverInterface> resolver,
        std::shared_ptr<ResolverGuard> guard,
        std::chrono::milliseconds timeout
    );

    [[nodiscard]] model::Prices
    resolve(std::string const& currency, model::Amount const& amount, std::uint64_t timestamp) override;
};

}  // namespace ingest::impl
