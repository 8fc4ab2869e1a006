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

#include "util/TestObject.hpp"

#include "ingest/Models.hpp"
#include "util/Hex.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::size_t kWORD = 32;
// decoders don't look at the signature topic, any distinct value does
constexpr unsigned kNEW_BID_ASK_NONCES_TOPIC = 1;
constexpr unsigned kNONCES_CANCELLED_TOPIC = 2;
constexpr unsigned kTAKER_TRADE_TOPIC = 3;
constexpr auto kTRANSFER_TOPIC = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

ingest::model::Bytes
leftPad(std::string_view hex)
{
    auto bytes = util::fromHex(hex);
    if (not bytes.has_value() or bytes->size() > kWORD)
        throw std::invalid_argument("Bad test hex value");

    ingest::model::Bytes word(kWORD - bytes->size(), 0);
    word.insert(word.end(), bytes->begin(), bytes->end());
    return word;
}

std::string
topicOf(std::string_view address)
{
    return util::toHex(leftPad(address));
}

}  // namespace

ingest::model::Bytes
createWord(ingest::model::Amount const& value)
{
    ingest::model::Bytes bytes;
    boost::multiprecision::export_bits(value, std::back_inserter(bytes), 8);

    ingest::model::Bytes word(kWORD - bytes.size(), 0);
    word.insert(word.end(), bytes.begin(), bytes.end());
    return word;
}

AbiWriter&
AbiWriter::uint256(ingest::model::Amount const& value)
{
    head_.push_back(createWord(value));
    return *this;
}

AbiWriter&
AbiWriter::address(std::string_view hex)
{
    head_.push_back(leftPad(hex));
    return *this;
}

AbiWriter&
AbiWriter::boolean(bool value)
{
    return uint256(value ? 1 : 0);
}

AbiWriter&
AbiWriter::bytes32(std::string_view hex)
{
    auto bytes = util::fromHex(hex);
    if (not bytes.has_value() or bytes->size() != kWORD)
        throw std::invalid_argument("Bad test bytes32 value");

    head_.push_back(std::move(bytes).value());
    return *this;
}

AbiWriter&
AbiWriter::uint256Array(std::vector<ingest::model::Amount> const& values)
{
    offsetSlots_.push_back(head_.size());
    head_.push_back(createWord(tail_.size()));  // patched in bytes()

    tail_.push_back(createWord(values.size()));
    for (auto const& value : values)
        tail_.push_back(createWord(value));

    return *this;
}

AbiWriter&
AbiWriter::rawWord(std::vector<std::uint8_t> word)
{
    head_.push_back(std::move(word));
    return *this;
}

ingest::model::Bytes
AbiWriter::bytes() const
{
    auto head = head_;
    for (auto const slot : offsetSlots_) {
        ingest::model::Amount tailIndex;
        boost::multiprecision::import_bits(tailIndex, head[slot].begin(), head[slot].end());
        head[slot] = createWord((head.size() + tailIndex.convert_to<std::size_t>()) * kWORD);
    }

    ingest::model::Bytes out;
    for (auto const& word : head)
        out.insert(out.end(), word.begin(), word.end());
    for (auto const& word : tail_)
        out.insert(out.end(), word.begin(), word.end());

    return out;
}

ingest::model::RawLog
createNewBidAskNoncesLog(
    std::string_view maker,
    ingest::model::Amount const& bidNonce,
    ingest::model::Amount const& askNonce
)
{
    return {
        .address = kEXCHANGE,
        .topics = {util::toHex(createWord(kNEW_BID_ASK_NONCES_TOPIC))},
        .data = AbiWriter{}.address(maker).uint256(bidNonce).uint256(askNonce).bytes(),
    };
}

ingest::model::RawLog
createNoncesCancelledLog(std::string_view maker, std::vector<ingest::model::Amount> const& nonces)
{
    return {
        .address = kEXCHANGE,
        .topics = {util::toHex(createWord(kNONCES_CANCELLED_TOPIC))},
        .data = AbiWriter{}.address(maker).uint256Array(nonces).bytes(),
    };
}

ingest::model::RawLog
createTakerTradeLog(TradeLogParams const& params)
{
    AbiWriter writer;
    writer.bytes32(params.orderHash)
        .uint256(params.orderNonce)
        .boolean(params.isNonceInvalidated)
        .address(params.firstUser)
        .address(params.secondUser)
        .uint256(params.strategyId)
        .address(params.currency)
        .address(params.collection)
        .uint256Array(params.itemIds)
        .uint256Array(params.amounts);

    for (auto const& recipient : params.feeRecipients)
        writer.address(recipient);
    for (auto const& amount : params.feeAmounts)
        writer.uint256(amount);

    return {
        .address = kEXCHANGE,
        .topics = {util::toHex(createWord(kTAKER_TRADE_TOPIC))},
        .data = writer.bytes(),
    };
}

ingest::model::RawLog
createErc20TransferLog(std::string_view contract)
{
    return {
        .address = std::string{contract},
        .topics = {kTRANSFER_TOPIC, topicOf(kTAKER), topicOf(kMAKER)},
        .data = createWord(1000),
    };
}

ingest::model::RawLog
createErc721TransferLog(std::string_view contract)
{
    return {
        .address = std::string{contract},
        .topics = {kTRANSFER_TOPIC, topicOf(kMAKER), topicOf(kTAKER), util::toHex(createWord(42))},
        .data = {},
    };
}

ingest::model::OriginParams
createOrigin(std::string_view txHash, std::uint32_t logIndex, std::uint32_t batchIndex)
{
    return {
        .txHash = std::string{txHash},
        .blockHash = kBLOCK_HASH,
        .block = kBLOCK,
        .logIndex = logIndex,
        .batchIndex = batchIndex,
        .timestamp = kTIMESTAMP,
        .contractAddress = kEXCHANGE,
    };
}

ingest::model::RawEvent
createRawEvent(
    ingest::model::EventKind kind,
    ingest::model::RawLog log,
    std::string_view txHash,
    std::uint32_t logIndex,
    std::uint32_t batchIndex
)
{
    return {.kind = kind, .origin = createOrigin(txHash, logIndex, batchIndex), .log = std::move(log)};
}
