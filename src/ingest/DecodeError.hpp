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
#include <stdexcept>
#include <string>

namespace ingest {

/**
 * @brief Why a raw log could not be decoded.
 */
struct DecodeError {
    enum class Code : std::uint8_t { Malformed, UnknownKind, RegistryUnavailable };

    Code code;
    std::string message;

    bool
    operator==(DecodeError const&) const = default;
};

/**
 * @brief Thrown out of normalization when no decoder is available at all.
 */
class DecoderRegistryUnavailable : public std::runtime_error {
public:
    explicit DecoderRegistryUnavailable(std::string const& what) : std::runtime_error(what)
    {
    }
};

}  // namespace ingest
