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

#include "ingest/Models.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace ingest::impl {

/**
 * @brief Thrown by AbiReader when the payload does not match the expected layout.
 */
class MalformedPayload : public std::runtime_error {
public:
    explicit MalformedPayload(std::string const& what) : std::runtime_error(what)
    {
    }
};

/**
 * @brief Reads Solidity ABI encoded values out of a log's data section.
 *
 * Values are addressed by the index of their 32-byte head word. Dynamic arrays are read through the offset stored in
 * their head word.
 */
class AbiReader {
    std::span<std::uint8_t const> data_;

public:
    static constexpr std::size_t kWORD_SIZE = 32;

    explicit AbiReader(std::span<std::uint8_t const> data);

    /**
     * @return Number of complete words in the payload
     */
    [[nodiscard]] std::size_t
    words() const;

    [[nodiscard]] model::Amount
    uint256At(std::size_t index) const;

    /**
     * @brief Read an address. The 12 leading bytes of the word must be zero.
     *
     * @param index The word index
     * @return The address as lower-case hex with a 0x prefix
     */
    [[nodiscard]] std::string
    addressAt(std::size_t index) const;

    [[nodiscard]] bool
    boolAt(std::size_t index) const;

    /**
     * @brief Read a bytes32 value.
     *
     * @param index The word index
     * @return The value as lower-case hex with a 0x prefix
     */
    [[nodiscard]] std::string
    bytes32At(std::size_t index) const;

    /**
     * @brief Read a dynamic uint256[] whose offset is stored at the given head word.
     *
     * @param index The word index of the offset
     * @return The elements
     */
    [[nodiscard]] std::vector<model::Amount>
    uint256ArrayAt(std::size_t index) const;

private:
    [[nodiscard]] std::span<std::uint8_t const>
    wordAtOffset(std::size_t offset) const;

    [[nodiscard]] std::size_t
    toSize(model::Amount const& value, char const* what) const;
};

}  // namespace ingest::impl
