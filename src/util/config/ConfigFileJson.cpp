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

#include "util/config/ConfigFileJson.hpp"

#include "util/Assert.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util::config {

namespace {

/**
 * @brief Extracts the value from a Json object and converts it into the corresponding type
 *
 * @param jsonValue The json value to extract
 * @return A variant containing the same type corresponding to the extracted value
 */
Value
extractJsonValue(boost::json::value const& jsonValue)
{
    if (jsonValue.is_int64())
        return jsonValue.as_int64();

    if (jsonValue.is_uint64())
        return static_cast<int64_t>(jsonValue.as_uint64());

    if (jsonValue.is_string())
        return jsonValue.as_string().c_str();

    if (jsonValue.is_bool())
        return jsonValue.as_bool();

    if (jsonValue.is_double())
        return jsonValue.as_double();

    ASSERT(false, "Json is not of type int, uint, string, bool or double");
    std::unreachable();
}

void
padArray(boost::json::value& target, std::size_t size)
{
    if (not target.is_array())
        target = boost::json::array{};

    auto& arr = target.as_array();
    while (arr.size() < size)
        arr.emplace_back(nullptr);
}

}  // namespace

ConfigFileJson::ConfigFileJson(boost::json::object jsonObj)
{
    flattenJson(jsonObj, "");
}

std::expected<ConfigFileJson, Error>
ConfigFileJson::makeConfigFileJson(std::string_view configFilePath)
{
    try {
        std::ifstream const in(std::string{configFilePath}, std::ios::in | std::ios::binary);
        if (in) {
            std::stringstream contents;
            contents << in.rdbuf();
            auto const tempObj = boost::json::parse(contents.str()).as_object();
            return ConfigFileJson{tempObj};
        }
        return std::unexpected<Error>(
            Error{fmt::format("Could not open configuration file '{}'", configFilePath)}
        );
    } catch (std::exception const& e) {
        return std::unexpected<Error>(Error{fmt::format(
            "An error occurred while processing configuration file '{}': {}", configFilePath, e.what()
        )});
    }
}

Value
ConfigFileJson::getValue(std::string_view key) const
{
    auto const jsonValue = jsonObject_.at(key);
    auto const value = extractJsonValue(jsonValue);
    return value;
}

std::vector<std::optional<Value>>
ConfigFileJson::getArray(std::string_view key) const
{
    ASSERT(jsonObject_.at(key).is_array(), "Key {} has value that is not an array", key);

    std::vector<std::optional<Value>> configValues;
    auto const arr = jsonObject_.at(key).as_array();

    for (auto const& item : arr) {
        if (item.is_null()) {
            configValues.emplace_back(std::nullopt);
        } else {
            configValues.emplace_back(extractJsonValue(item));
        }
    }
    return configValues;
}

bool
ConfigFileJson::containsKey(std::string_view key) const
{
    return jsonObject_.contains(key);
}

std::vector<std::string>
ConfigFileJson::keys() const
{
    std::vector<std::string> out;
    out.reserve(jsonObject_.size());
    for (auto const& [key, _] : jsonObject_)
        out.emplace_back(key);
    return out;
}

void
ConfigFileJson::flattenJson(boost::json::object const& obj, std::string const& prefix)
{
    for (auto const& [key, value] : obj) {
        std::string const fullKey = prefix.empty() ? std::string(key) : fmt::format("{}.{}", prefix, key);

        if (value.is_object()) {
            flattenJson(value.as_object(), fullKey);
        } else if (value.is_array()) {
            auto const& arr = value.as_array();
            auto const arrayKey = fmt::format("{}.[]", fullKey);

            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (arr[i].is_object()) {
                    ConfigFileJson const element{arr[i].as_object()};
                    for (auto const& [innerKey, innerValue] : element.jsonObject_) {
                        auto& target = jsonObject_[fmt::format("{}.{}", arrayKey, std::string_view{innerKey})];
                        padArray(target, i);
                        target.as_array().push_back(innerValue);
                    }
                } else {
                    auto& target = jsonObject_[arrayKey];
                    padArray(target, i);
                    target.as_array().push_back(arr[i]);
                }
            }

            // fields missing from trailing elements are filled with null
            for (auto& [flatKey, flatValue] : jsonObject_) {
                if (std::string_view{flatKey}.starts_with(arrayKey))
                    padArray(flatValue, arr.size());
            }
        } else {
            jsonObject_[fullKey] = value;
        }
    }
}

}  // namespace util::config
