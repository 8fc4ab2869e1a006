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

#include "ingest/Models.hpp"
#include "ingest/impl/AbiReader.hpp"
#include "util/TestObject.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace ingest::impl;
using ingest::model::Amount;

namespace {

Amount const kMAX_UINT256{"115792089237316195423570985008687907853269984665640564039457584007913129639935"};

}  // namespace

TEST(AbiReaderTests, ReadsStaticValues)
{
    auto const data = AbiWriter{}
                          .uint256(kMAX_UINT256)
                          .address("0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2")
                          .boolean(true)
                          .bytes32(kORDER_HASH)
                          .bytes();
    AbiReader const reader{data};

    EXPECT_EQ(reader.words(), 4);
    EXPECT_EQ(reader.uint256At(0), kMAX_UINT256);
    EXPECT_EQ(reader.addressAt(1), "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
    EXPECT_TRUE(reader.boolAt(2));
    EXPECT_EQ(reader.bytes32At(3), kORDER_HASH);
}

TEST(AbiReaderTests, ReadsDynamicArrays)
{
    auto const data = AbiWriter{}.address(kMAKER).uint256Array({1, 2, 3}).uint256Array({}).bytes();
    AbiReader const reader{data};

    EXPECT_EQ(reader.uint256ArrayAt(1), (std::vector<Amount>{1, 2, 3}));
    EXPECT_TRUE(reader.uint256ArrayAt(2).empty());
}

TEST(AbiReaderTests, ReadPastEndThrows)
{
    auto const data = AbiWriter{}.uint256(1).bytes();
    AbiReader const reader{data};

    EXPECT_THROW([[maybe_unused]] auto v = reader.uint256At(1), MalformedPayload);
}

TEST(AbiReaderTests, TruncatedWordThrows)
{
    auto data = AbiWriter{}.uint256(1).uint256(2).bytes();
    data.pop_back();
    AbiReader const reader{data};

    EXPECT_EQ(reader.words(), 1);
    EXPECT_THROW([[maybe_unused]] auto v = reader.uint256At(1), MalformedPayload);
}

TEST(AbiReaderTests, DirtyAddressPaddingThrows)
{
    auto const data = AbiWriter{}.uint256(Amount{1} << 200).bytes();
    AbiReader const reader{data};

    EXPECT_THROW([[maybe_unused]] auto v = reader.addressAt(0), MalformedPayload);
}

TEST(AbiReaderTests, InvalidBoolThrows)
{
    auto const data = AbiWriter{}.uint256(2).bytes();
    AbiReader const reader{data};

    EXPECT_THROW([[maybe_unused]] auto v = reader.boolAt(0), MalformedPayload);
}

TEST(AbiReaderTests, ArrayOffsetOutOfBoundsThrows)
{
    auto const data = AbiWriter{}.uint256(4096).bytes();
    AbiReader const reader{data};

    EXPECT_THROW([[maybe_unused]] auto v = reader.uint256ArrayAt(0), MalformedPayload);
}

TEST(AbiReaderTests, ArrayLengthPastEndThrows)
{
    // offset 32 points at a length of 5 with only one element following
    auto const data = AbiWriter{}.uint256(32).uint256(5).uint256(1).bytes();
    AbiReader const reader{data};

    EXPECT_THROW([[maybe_unused]] auto v = reader.uint256ArrayAt(0), MalformedPayload);
}

TEST(AbiReaderTests, MisalignedArrayOffsetThrows)
{
    auto const data = AbiWriter{}.uint256(33).uint256(0).uint256(0).bytes();
    AbiReader const reader{data};

    EXPECT_THROW([[maybe_unused]] auto v = reader.uint256ArrayAt(0), MalformedPayload);
}
