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
#include "util/config/Array.hpp"
#include "util/config/ConfigConstraints.hpp"
#include "util/config/ConfigFileJson.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/Types.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

/**
 * @brief All the config data will be stored and extracted from this class
 *
 * Represents all the possible config data
 */
class ConfigDefinition {
public:
    /** @brief A key-value pair of the config definition */
    using KeyValuePair = std::pair<std::string_view, std::variant<ConfigValue, Array>>;

    /**
     * @brief Constructs a new ConfigDefinition
     *
     * Initializes the configuration with a predefined set of key-value pairs
     * If a key contains "[]", the corresponding value must be an Array
     *
     * @param pair A list of key-value pairs for the predefined set of config
     */
    ConfigDefinition(std::initializer_list<KeyValuePair> pair);

    /**
     * @brief Parses the configuration file
     *
     * Also checks that no extra configuration key/value pairs are present. Adds to list of Errors
     * if it does
     *
     * @param config The configuration file interface
     * @return An optional vector of Error objects stating all the failures if parsing fails
     */
    [[nodiscard]] std::optional<std::vector<Error>>
    parse(ConfigFileJson const& config);

    /**
     * @brief Returns the value of a required key
     *
     * @tparam T The type to return
     * @param key The config key
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view key) const
    {
        auto const& value = getValueView(key);
        ASSERT(value.hasValue(), "Key {} has no value", key);
        return extractValue<T>(value.getValue());
    }

    /**
     * @brief Returns the value of an optional key
     *
     * @tparam T The type to return
     * @param key The config key
     * @return The value or std::nullopt if neither the user nor a default provided one
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view key) const
    {
        auto const& value = getValueView(key);
        if (not value.hasValue())
            return std::nullopt;
        return extractValue<T>(value.getValue());
    }

    /**
     * @brief Returns the value stored at the given index of an Array
     *
     * @param key The full array key, e.g. `log_channels.[].channel`
     * @param index The element index
     * @return The ConfigValue of the element
     */
    [[nodiscard]] ConfigValue const&
    arrayValueAt(std::string_view key, std::size_t index) const;

    /**
     * @brief Returns a view for each element of an array of objects
     *
     * @param prefix The key of the array without the `.[]` suffix, e.g. `log_channels`
     * @return One view per element the user specified
     */
    [[nodiscard]] std::vector<ObjectView>
    getArray(std::string_view prefix) const;

    /**
     * @brief Returns the number of elements of an array of objects
     *
     * @param prefix The key of the array without the `.[]` suffix
     * @return The number of elements
     */
    [[nodiscard]] std::size_t
    arraySize(std::string_view prefix) const;

    /**
     * @brief Returns every key of the definition
     *
     * @return The keys; array keys use the `prefix.[].key` form
     */
    [[nodiscard]] std::vector<std::string_view>
    keys() const;

private:
    [[nodiscard]] ConfigValue const&
    getValueView(std::string_view key) const;

    std::unordered_map<std::string_view, std::variant<ConfigValue, Array>> map_;
};

template <typename T>
T
ObjectView::get(std::string_view key) const
{
    auto const& value = definition_.arrayValueAt(fullKey(key), index_);
    ASSERT(value.hasValue(), "Key {} has no value at index {}", fullKey(key), index_);
    return extractValue<T>(value.getValue());
}

template <typename T>
std::optional<T>
ObjectView::maybeValue(std::string_view key) const
{
    auto const& value = definition_.arrayValueAt(fullKey(key), index_);
    if (not value.hasValue())
        return std::nullopt;
    return extractValue<T>(value.getValue());
}

/**
 * @brief Full Config definition for marketsync.
 *
 * Specifies all the keys, their types, defaults and constraints.
 */
inline ConfigDefinition gMarketsyncConfig = ConfigDefinition{
    {"sync.workers", ConfigValue{ConfigType::Integer}.defaultValue(4).withConstraint(gValidateUint16)},
    {"sync.resolver_threads", ConfigValue{ConfigType::Integer}.defaultValue(4).withConstraint(gValidateUint16)},
    {"sync.price_timeout_ms",
     ConfigValue{ConfigType::Integer}.defaultValue(2000).withConstraint(gValidatePositiveUint32)},
    {"sync.attribution_timeout_ms",
     ConfigValue{ConfigType::Integer}.defaultValue(2000).withConstraint(gValidatePositiveUint32)},

    {"prices.[].currency", Array{ConfigValue{ConfigType::String}}},
    {"prices.[].native_rate_ppm", Array{ConfigValue{ConfigType::Integer}.withConstraint(gValidateUint32)}},
    {"prices.[].usd_rate_ppm", Array{ConfigValue{ConfigType::Integer}.optional().withConstraint(gValidateUint32)}},

    {"log_channels.[].channel", Array{ConfigValue{ConfigType::String}.optional().withConstraint(gValidateChannelName)}
    },
    {"log_channels.[].log_level",
     Array{ConfigValue{ConfigType::String}.optional().withConstraint(gValidateLogLevelName)}},

    {"log_level", ConfigValue{ConfigType::String}.defaultValue("info").withConstraint(gValidateLogLevelName)},

    {"log_format",
     ConfigValue{ConfigType::String}.defaultValue(
         R"(%TimeStamp% (%SourceLocation%) [%ThreadID%] %Channel%:%Severity% %Message%)"
     )},

    {"log_to_console", ConfigValue{ConfigType::Boolean}.defaultValue(false)},

    {"log_directory", ConfigValue{ConfigType::String}.optional()},

    {"log_rotation_size", ConfigValue{ConfigType::Integer}.defaultValue(2048).withConstraint(gValidateUint32)},

    {"log_directory_max_size",
     ConfigValue{ConfigType::Integer}.defaultValue(50 * 1024).withConstraint(gValidateUint32)},

    {"log_rotation_hour_interval", ConfigValue{ConfigType::Integer}.defaultValue(12).withConstraint(gValidateUint32)},
};

}  // namespace util::config
