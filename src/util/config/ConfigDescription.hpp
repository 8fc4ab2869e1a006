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

#include "util/Assert.hpp"

#include <algorithm>
#include <array>
#include <ostream>
#include <string_view>

namespace util::config {

/**
 * @brief Human readable descriptions of every key in @ref gMarketsyncConfig
 *
 * Printed by `marketsync --config-description`.
 */
class ConfigDescription {
public:
    /** @brief A config key and what it controls */
    struct Entry {
        std::string_view key;
        std::string_view description;
    };

    ConfigDescription() = delete;

private:
    static constexpr auto
    find(std::string_view key)
    {
        return std::ranges::find(kENTRIES, key, &Entry::key);
    }

public:
    /**
     * @brief Retrieves the description for a given key; the key must be described
     *
     * @param key The key to look up the description for
     * @return The description associated with the key
     */
    [[nodiscard]] static constexpr std::string_view
    get(std::string_view key)
    {
        auto const itr = find(key);
        ASSERT(itr != kENTRIES.end(), "Key {} has no description", key);
        return itr->description;
    }

    /**
     * @brief Check whether a key is described
     *
     * @param key The key to look up
     * @return true if a description exists
     */
    [[nodiscard]] static constexpr bool
    contains(std::string_view key)
    {
        return find(key) != kENTRIES.end();
    }

    /**
     * @brief Writes one `key: description` line per key
     *
     * @param out The stream to write to
     */
    static void
    write(std::ostream& out)
    {
        for (auto const& [key, description] : kENTRIES)
            out << key << ": " << description << '\n';
    }

private:
    static constexpr auto kENTRIES = std::array{
        Entry{
            .key = "sync.workers",
            .description = "Number of threads normalizing independent transactions of one batch concurrently."
        },
        Entry{
            .key = "sync.resolver_threads",
            .description = "Number of threads running price and attribution lookups."
        },
        Entry{
            .key = "sync.price_timeout_ms",
            .description = "Maximum time in milliseconds to wait for a price lookup. A timed out lookup drops the fill."
        },
        Entry{
            .key = "sync.attribution_timeout_ms",
            .description = "Maximum time in milliseconds to wait for an attribution lookup. A timed out lookup keeps "
                           "the decoded taker and attaches no sources."
        },
        Entry{.key = "prices.[].currency", .description = "Currency contract address of a fixed-rate price entry."},
        Entry{
            .key = "prices.[].native_rate_ppm",
            .description = "Native-asset value of one currency unit, in parts per million."
        },
        Entry{.key = "prices.[].usd_rate_ppm", .description = "USD value of one currency unit, in parts per million."},
        Entry{.key = "log_channels.[].channel", .description = "Name of the log channel."},
        Entry{.key = "log_channels.[].log_level", .description = "Log level for the log channel."},
        Entry{.key = "log_level", .description = "General logging level of marketsync."},
        Entry{.key = "log_format", .description = "Format string for log messages."},
        Entry{.key = "log_to_console", .description = "Enable or disable logging to console."},
        Entry{.key = "log_directory", .description = "Directory path for log files."},
        Entry{.key = "log_rotation_size", .description = "Log rotation size in megabytes."},
        Entry{.key = "log_directory_max_size", .description = "Maximum size of the log directory in megabytes."},
        Entry{.key = "log_rotation_hour_interval", .description = "Interval in hours for log rotation."},
    };
};

}  // namespace util::config
