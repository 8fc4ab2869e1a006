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

#include "util/config/ConfigDefinition.hpp"

#include "util/Assert.hpp"
#include "util/OverloadSet.hpp"
#include "util/config/Array.hpp"
#include "util/config/ConfigFileJson.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/ObjectView.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace util::config {

ConfigDefinition::ConfigDefinition(std::initializer_list<KeyValuePair> pair) : map_{pair}
{
    for (auto const& [key, value] : pair) {
        if (key.contains("[]"))
            ASSERT(std::holds_alternative<Array>(value), "Value of key {} must be an Array", key);
    }
}

ConfigValue const&
ConfigDefinition::getValueView(std::string_view key) const
{
    auto const it = map_.find(key);
    ASSERT(it != map_.end(), "Key {} does not exist in config", key);
    ASSERT(std::holds_alternative<ConfigValue>(it->second), "Key {} is an array; use getArray()", key);
    return std::get<ConfigValue>(it->second);
}

ConfigValue const&
ConfigDefinition::arrayValueAt(std::string_view key, std::size_t index) const
{
    auto const it = map_.find(key);
    ASSERT(it != map_.end(), "Key {} does not exist in config", key);
    ASSERT(std::holds_alternative<Array>(it->second), "Key {} is not an array", key);
    return std::get<Array>(it->second).at(index);
}

std::size_t
ConfigDefinition::arraySize(std::string_view prefix) const
{
    auto const arrayPrefix = fmt::format("{}.[]", prefix);
    std::size_t size = 0;
    for (auto const& [key, value] : map_) {
        if (key.starts_with(arrayPrefix) and std::holds_alternative<Array>(value))
            size = std::max(size, std::get<Array>(value).size());
    }
    return size;
}

std::vector<ObjectView>
ConfigDefinition::getArray(std::string_view prefix) const
{
    std::vector<ObjectView> views;
    auto const size = arraySize(prefix);
    views.reserve(size);

    for (std::size_t i = 0; i < size; ++i)
        views.emplace_back(*this, prefix, i);

    return views;
}

std::vector<std::string_view>
ConfigDefinition::keys() const
{
    std::vector<std::string_view> keys;
    keys.reserve(map_.size());
    for (auto const& [key, _] : map_)
        keys.push_back(key);

    std::ranges::sort(keys);
    return keys;
}

std::optional<std::vector<Error>>
ConfigDefinition::parse(ConfigFileJson const& config)
{
    std::vector<Error> listOfErrors;

    for (auto const& key : config.keys()) {
        if (not map_.contains(key))
            listOfErrors.emplace_back(key, "is not a valid config key");
    }

    for (auto& [key, value] : map_) {
        std::visit(
            util::OverloadSet{
                [&key, &config, &listOfErrors](ConfigValue& val) {
                    if (config.containsKey(key)) {
                        if (auto const err = val.setValue(config.getValue(key), key); err.has_value())
                            listOfErrors.push_back(*err);
                    } else if (not val.hasValue() and not val.isOptional()) {
                        listOfErrors.emplace_back(key, "key is required in user Config");
                    }
                },
                [&key, &config, &listOfErrors](Array& arr) {
                    arr.clear();
                    if (not config.containsKey(key))
                        return;

                    for (auto const& item : config.getArray(key)) {
                        if (auto const err = arr.addValue(item, key); err.has_value())
                            listOfErrors.push_back(*err);
                    }
                }
            },
            value
        );
    }

    if (!listOfErrors.empty())
        return listOfErrors;

    return std::nullopt;
}

}  // namespace util::config
