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

#include "ingest/impl/AbiReader.hpp"

#include "ingest/Models.hpp"
#include "util/Hex.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ingest::impl {

namespace {

constexpr std::size_t kADDRESS_PADDING = 12;

model::Amount
toAmount(std::span<std::uint8_t const> word)
{
    model::Amount value;
    boost::multiprecision::import_bits(value, word.begin(), word.end());
    return value;
}

}  // namespace

AbiReader::AbiReader(std::span<std::uint8_t const> data) : data_{data}
{
}

std::size_t
AbiReader::words() const
{
    return data_.size() / kWORD_SIZE;
}

model::Amount
AbiReader::uint256At(std::size_t index) const
{
    return toAmount(wordAtOffset(index * kWORD_SIZE));
}

std::string
AbiReader::addressAt(std::size_t index) const
{
    auto const word = wordAtOffset(index * kWORD_SIZE);
    auto const padding = word.first(kADDRESS_PADDING);
    if (not std::ranges::all_of(padding, [](auto byte) { return byte == 0u; }))
        throw MalformedPayload(fmt::format("Word {} is not an address", index));

    return util::toHex(word.subspan(kADDRESS_PADDING));
}

bool
AbiReader::boolAt(std::size_t index) const
{
    auto const value = toAmount(wordAtOffset(index * kWORD_SIZE));
    if (value > 1)
        throw MalformedPayload(fmt::format("Word {} is not a bool", index));

    return value == 1;
}

std::string
AbiReader::bytes32At(std::size_t index) const
{
    return util::toHex(wordAtOffset(index * kWORD_SIZE));
}

std::vector<model::Amount>
AbiReader::uint256ArrayAt(std::size_t index) const
{
    auto const offset = toSize(uint256At(index), "array offset");
    if (offset % kWORD_SIZE != 0)
        throw MalformedPayload(fmt::format("Misaligned array offset {} at word {}", offset, index));

    auto const length = toSize(toAmount(wordAtOffset(offset)), "array length");
    if (length > (data_.size() - offset) / kWORD_SIZE)
        throw MalformedPayload(fmt::format("Array at word {} of length {} runs past the payload", index, length));

    std::vector<model::Amount> values;
    values.reserve(length);
    for (std::size_t i = 1; i <= length; ++i)
        values.push_back(toAmount(wordAtOffset(offset + i * kWORD_SIZE)));

    return values;
}

std::span<std::uint8_t const>
AbiReader::wordAtOffset(std::size_t offset) const
{
    if (offset > data_.size() or data_.size() - offset < kWORD_SIZE)
        throw MalformedPayload(fmt::format("Read at offset {} past the payload of {} bytes", offset, data_.size()));

    return data_.subspan(offset, kWORD_SIZE);
}

std::size_t
AbiReader::toSize(model::Amount const& value, char const* what) const
{
    if (value > data_.size())
        throw MalformedPayload(fmt::format("The {} {} is out of bounds", what, value.str()));

    return value.convert_to<std::size_t>();
}

}  // namespace ingest::impl
