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

#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"

#include <iostream>
#include <string_view>

namespace app {

/**
 * @brief Loads the config file into the definition and reports every problem on stderr
 *
 * @param configPath The path to config
 * @param config The definition to fill
 * @return true if config values are all correct, false otherwise
 */
inline bool
parseConfig(std::string_view configPath, util::config::ConfigDefinition& config)
{
    using namespace util::config;

    auto const json = ConfigFileJson::makeConfigFileJson(configPath);
    if (not json.has_value()) {
        std::cerr << json.error().error << std::endl;
        return false;
    }

    auto const errors = config.parse(json.value());
    if (errors.has_value()) {
        for (auto const& err : errors.value())
            std::cerr << err.error << std::endl;
        return false;
    }
    return true;
}

/**
 * @brief Verifies user's config values are correct without touching the global config
 *
 * @param configPath The path to config
 * @return true if config values are all correct, false otherwise
 */
inline bool
verifyConfig(std::string_view configPath)
{
    auto config = util::config::gMarketsyncConfig;
    return parseConfig(configPath, config);
}

}  // namespace app
