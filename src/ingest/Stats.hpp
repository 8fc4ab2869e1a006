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

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <string>

namespace ingest {

/**
 * @brief A snapshot of the normalization counters.
 */
struct Statistics {
    std::uint64_t events = 0;
    std::uint64_t records = 0;
    std::uint64_t ignoredKinds = 0;
    std::uint64_t decodeErrors = 0;
    std::uint64_t bundleSkips = 0;
    std::uint64_t missingPrices = 0;
    std::uint64_t dataQualitySkips = 0;

    bool
    operator==(Statistics const&) const = default;

    Statistics&
    operator+=(Statistics const& other)
    {
        events += other.events;
        records += other.records;
        ignoredKinds += other.ignoredKinds;
        decodeErrors += other.decodeErrors;
        bundleSkips += other.bundleSkips;
        missingPrices += other.missingPrices;
        dataQualitySkips += other.dataQualitySkips;
        return *this;
    }

    [[nodiscard]] std::string
    toString() const
    {
        return fmt::format(
            "events = {}; records = {}; ignored = {}; decode errors = {}; bundles = {}; missing prices = {}; "
            "data quality = {}",
            events,
            records,
            ignoredKinds,
            decodeErrors,
            bundleSkips,
            missingPrices,
            dataQualitySkips
        );
    }
};

/**
 * @brief Counters updated while normalizing. Safe to read from other threads.
 */
class Stats {
    std::atomic_uint64_t events_ = 0;
    std::atomic_uint64_t records_ = 0;
    std::atomic_uint64_t ignoredKinds_ = 0;
    std::atomic_uint64_t decodeErrors_ = 0;
    std::atomic_uint64_t bundleSkips_ = 0;
    std::atomic_uint64_t missingPrices_ = 0;
    std::atomic_uint64_t dataQualitySkips_ = 0;

public:
    void
    event()
    {
        ++events_;
    }

    void
    records(std::uint64_t count)
    {
        records_ += count;
    }

    void
    ignoredKind()
    {
        ++ignoredKinds_;
    }

    void
    decodeError()
    {
        ++decodeErrors_;
    }

    void
    bundleSkip()
    {
        ++bundleSkips_;
    }

    void
    missingPrice()
    {
        ++missingPrices_;
    }

    void
    dataQualitySkip()
    {
        ++dataQualitySkips_;
    }

    [[nodiscard]] Statistics
    snapshot() const
    {
        return {
            .events = events_.load(),
            .records = records_.load(),
            .ignoredKinds = ignoredKinds_.load(),
            .decodeErrors = decodeErrors_.load(),
            .bundleSkips = bundleSkips_.load(),
            .missingPrices = missingPrices_.load(),
            .dataQualitySkips = dataQualitySkips_.load(),
        };
    }
};

}  // namespace ingest
