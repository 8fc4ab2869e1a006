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

#include <string>

namespace app {

/**
 * @brief The main marketsync application: normalizes a file of raw events and prints the records.
 */
class SyncApplication {
    util::config::ConfigDefinition const& config_;

public:
    /**
     * @brief Construct a new SyncApplication object
     *
     * @param config The configuration of the application
     */
    SyncApplication(util::config::ConfigDefinition const& config);

    /**
     * @brief Run the application
     *
     * @param eventsPath File with a JSON array of raw events
     * @return exit code
     */
    int
    run(std::string const& eventsPath);
};

}  // namespace app
