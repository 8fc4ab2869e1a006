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

#include "util/Assert.hpp"

#include "util/SourceLocation.hpp"
#include "util/log/Logger.hpp"

#include <boost/log/core/core.hpp>
#include <fmt/core.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace util::impl {

void
onAssertionFailure(SourceLocationType const& location, char const* expression, std::string const& message)
{
    auto const resultMessage = fmt::format(
        "Assertion '{}' failed at {}:{}:\n{}", expression, location.file_name(), location.line(), message
    );

    if (boost::log::core::get()->get_logging_enabled()) {
        LOG(LogService::fatal()) << resultMessage;
    } else {
        std::cerr << resultMessage;
    }

    std::exit(EXIT_FAILURE);  // std::abort does not flush gcovr output and causes uncovered lines
}

}  // namespace util::impl
