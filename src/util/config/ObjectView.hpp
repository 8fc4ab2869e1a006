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

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace util::config {

class ConfigDefinition;

/**
 * @brief Provides a view into a single element of an array of objects in the config
 *
 * For the definition keys `log_channels.[].channel` and `log_channels.[].log_level`, the view for index `i` of
 * prefix `log_channels` resolves `get<std::string>("channel")` to the `i`-th value of `log_channels.[].channel`.
 */
class ObjectView {
public:
    /**
     * @brief Constructs a view of an element of an array of objects
     *
     * @param definition The config definition the view refers to
     * @param prefix The key of the array, e.g. `log_channels`
     * @param index The index of the element
     */
    ObjectView(ConfigDefinition const& definition, std::string_view prefix, std::size_t index)
        : definition_{definition}, prefix_{prefix}, index_{index}
    {
    }

    /**
     * @brief Returns the value of a required field of this element
     *
     * @tparam T The type to return
     * @param key The field name relative to the element
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view key) const;

    /**
     * @brief Returns the value of an optional field of this element
     *
     * @tparam T The type to return
     * @param key The field name relative to the element
     * @return The value or std::nullopt if the user did not provide it
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view key) const;

private:
    [[nodiscard]] std::string
    fullKey(std::string_view key) const
    {
        return fmt::format("{}.[].{}", prefix_, key);
    }

    ConfigDefinition const& definition_;
    std::string prefix_;
    std::size_t index_;
};

}  // namespace util::config
