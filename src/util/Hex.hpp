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

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace util {

/**
 * @brief Encodes bytes as lower-case hex with a `0x` prefix
 *
 * @param bytes The bytes to encode
 * @return The hex string
 */
[[nodiscard]] std::string
toHex(std::span<std::uint8_t const> bytes);

/**
 * @brief Decodes a hex string; the `0x` prefix is optional
 *
 * @param hex The string to decode
 * @return The decoded bytes or std::nullopt if the input is not valid hex
 */
[[nodiscard]] std::optional<std::vector<std::uint8_t>>
fromHex(std::string_view hex);

/**
 * @brief Lower-cases a hex string such as an address or a hash
 *
 * @param hex The string to normalize
 * @return The lower-case copy
 */
[[nodiscard]] std::string
toLowerHex(std::string_view hex);

}  // namespace util
