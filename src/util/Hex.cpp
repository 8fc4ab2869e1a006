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

#include "util/Hex.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace util {

std::string
toHex(std::span<std::uint8_t const> bytes)
{
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(out));
    return out;
}

std::optional<std::vector<std::uint8_t>>
fromHex(std::string_view hex)
{
    if (hex.starts_with("0x") or hex.starts_with("0X"))
        hex.remove_prefix(2);

    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2);

    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(out));
    } catch (boost::algorithm::hex_decode_error const&) {
        return std::nullopt;
    }

    return out;
}

std::string
toLowerHex(std::string_view hex)
{
    return boost::algorithm::to_lower_copy(std::string{hex});
}

}  // namespace util
