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

#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util::config {

/**
 * @brief Json representation of config
 *
 * Nested objects are flattened into dot separated keys. Arrays get a `.[]` suffix, so that the fields of an array of
 * objects become keys like `log_channels.[].channel`, each holding one entry per element of the array.
 */
class ConfigFileJson {
public:
    /**
     * @brief Construct a new ConfigJson object and stores the values from
     * user's config into a json object.
     *
     * @param jsonObj the Json object to parse; represents user's config
     */
    ConfigFileJson(boost::json::object jsonObj);

    /**
     * @brief Retrieves a configuration value by its key.
     *
     * @param key The key of the configuration value to retrieve.
     * @return A variant containing the same type corresponding to the extracted value.
     */
    [[nodiscard]] Value
    getValue(std::string_view key) const;

    /**
     * @brief Retrieves an array of configuration values by its key.
     *
     * @param key The key of the configuration array to retrieve.
     * @return A vector of variants holding the config values specified by user; nullopt for missing elements
     */
    [[nodiscard]] std::vector<std::optional<Value>>
    getArray(std::string_view key) const;

    /**
     * @brief Checks if the configuration contains a specific key.
     *
     * @param key The key to check for.
     * @return True if the key exists, false otherwise.
     */
    [[nodiscard]] bool
    containsKey(std::string_view key) const;

    /**
     * @brief Lists all flattened keys present in the user's config
     *
     * @return The keys
     */
    [[nodiscard]] std::vector<std::string>
    keys() const;

    /**
     * @brief Creates a configuration object from a file
     *
     * @param configFilePath The path to the configuration file
     * @return The configuration object or an Error if the file could not be read or parsed
     */
    [[nodiscard]] static std::expected<ConfigFileJson, Error>
    makeConfigFileJson(std::string_view configFilePath);

private:
    /**
     * @brief Recursive function to flatten a JSON object into the same structure as the config definition
     *
     * @param obj The JSON object to flatten
     * @param prefix The prefix to use for the keys in the flattened object
     */
    void
    flattenJson(boost::json::object const& obj, std::string const& prefix);

    boost::json::object jsonObject_;
};

}  // namespace util::config
