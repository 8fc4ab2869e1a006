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

#include "util/Concepts.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ingest::model {

/**
 * @brief 256-bit unsigned integer for on-chain amounts, prices and nonces.
 */
using Amount = boost::multiprecision::uint256_t;

/**
 * @brief Raw bytes as found in a log's data section.
 */
using Bytes = std::vector<std::uint8_t>;

/**
 * @brief The closed set of raw event kinds the indexer can decode.
 *
 * Each kind is one event of one marketplace protocol. Adding a protocol means adding its kinds here, a decoder for
 * each kind and listing the kinds in the `Spec` of the rules that settle them.
 *
 * Token transfers are not settled by any rule. They only feed the transaction log cache. So does `Other`, which stands
 * for any input tag the engine does not know.
 */
enum class EventKind : std::uint8_t {
    LooksRareV2NewBidAskNonces,
    LooksRareV2SubsetNoncesCancelled,
    LooksRareV2OrderNoncesCancelled,
    LooksRareV2TakerAsk,
    LooksRareV2TakerBid,
    Erc20Transfer,
    Erc721Transfer,
    Other,
};

/**
 * @brief The marketplace protocol an order belongs to.
 */
enum class OrderKind : std::uint8_t {
    LooksRareV2,
};

enum class OrderSide : std::uint8_t { Buy, Sell };

/**
 * @brief Event kind filter for the rule Registry.
 *
 * Lists the event kinds a rule wants to see. A rule is only handed decoded events of the listed kinds.
 * It's a compilation error to list the same kind more than once.
 */
template <EventKind... Kinds>
    requires(util::hasNoDuplicates(Kinds...))
struct Spec {
    static constexpr bool kSPEC_TAG = true;

    /**
     * @brief Checks if the event kind was requested.
     *
     * @param kind The event kind
     * @return true if the kind was requested; false otherwise
     */
    [[nodiscard]] static constexpr bool
    wants(EventKind kind) noexcept
    {
        return ((Kinds == kind) || ...);
    }
};

/**
 * @brief Where a canonical record comes from.
 *
 * `(txHash, logIndex, batchIndex)` identifies a record globally; downstream persistence upserts on it.
 */
struct OriginParams {
    std::string txHash;
    std::string blockHash;
    std::uint64_t block = 0;
    std::uint32_t logIndex = 0;
    std::uint32_t batchIndex = 1;
    std::uint64_t timestamp = 0;
    std::string contractAddress;

    bool
    operator==(OriginParams const&) const = default;
};

/**
 * @brief An EVM log as emitted on chain.
 */
struct RawLog {
    std::string address;
    std::vector<std::string> topics;  // lower-case hex, topics[0] is the event signature
    Bytes data;

    bool
    operator==(RawLog const&) const = default;
};

/**
 * @brief A raw event ready for normalization. Produced upstream, never modified.
 */
struct RawEvent {
    EventKind kind;
    OriginParams origin;
    RawLog log;
    std::string otherKind{};  ///< Input tag of an `EventKind::Other` event; empty otherwise

    bool
    operator==(RawEvent const&) const = default;
};

// Decoded events. Addresses and hashes are lower-case hex with a `0x` prefix.

/**
 * @brief A maker moved both of its bulk nonces forward.
 */
struct BidAskNonces {
    OrderKind orderKind;
    std::string maker;
    Amount bidNonce;
    Amount askNonce;

    bool
    operator==(BidAskNonces const&) const = default;
};

/**
 * @brief A maker cancelled a list of exact nonces, either order nonces or subset nonces.
 */
struct NoncesCancelled {
    OrderKind orderKind;
    std::string maker;
    std::vector<Amount> nonces;
    bool isSubset = false;

    bool
    operator==(NoncesCancelled const&) const = default;
};

/**
 * @brief A taker executed a maker's order.
 */
struct TakerTrade {
    OrderKind orderKind;
    OrderSide orderSide;  // side of the executed order, from the maker's perspective
    std::string orderId;
    Amount orderNonce;
    bool isNonceInvalidated = false;
    std::string maker;
    std::string taker;
    Amount strategyId;
    std::string currency;
    std::string collection;
    std::vector<Amount> itemIds;
    std::vector<Amount> amounts;
    std::array<std::string, 2> feeRecipients;
    std::array<Amount, 3> feeAmounts;

    bool
    operator==(TakerTrade const&) const = default;
};

using DecodedEvent = std::variant<BidAskNonces, NoncesCancelled, TakerTrade>;

// Canonical records

struct FillEvent {
    OrderKind orderKind;
    std::string orderId;
    OrderSide orderSide;
    std::string maker;
    std::string taker;
    Amount price;  // native
    std::string currency;
    Amount currencyPrice;  // per single unit of the asset
    std::optional<Amount> usdPrice;
    std::string contract;
    std::string tokenId;
    std::string amount;
    std::optional<std::int64_t> orderSourceId;
    std::optional<std::int64_t> aggregatorSourceId;
    std::optional<std::int64_t> fillSourceId;
    OriginParams origin;

    bool
    operator==(FillEvent const&) const = default;
};

struct NonceCancelEvent {
    OrderKind orderKind;
    std::string maker;
    Amount nonce;
    bool isSubset = false;
    OriginParams origin;

    bool
    operator==(NonceCancelEvent const&) const = default;
};

/**
 * @brief Invalidates all orders of the maker and side whose nonce is below or equal to minNonce.
 */
struct BulkCancelEvent {
    OrderKind orderKind;
    std::string maker;
    Amount minNonce;
    OrderSide orderSide;
    bool acrossAll = false;
    OriginParams origin;

    bool
    operator==(BulkCancelEvent const&) const = default;
};

enum class TriggerKind : std::uint8_t { Sale, Cancel, ApprovalChange };

struct Trigger {
    TriggerKind kind;
    std::string txHash;
    std::uint64_t txTimestamp = 0;

    bool
    operator==(Trigger const&) const = default;
};

/**
 * @brief Drives an order's status transition; `context` deduplicates repeated triggers for the same cause.
 */
struct OrderInfo {
    std::string context;
    std::string orderId;
    Trigger trigger;

    bool
    operator==(OrderInfo const&) const = default;
};

/**
 * @brief Denormalized projection of a fill for statistics and activity feeds.
 */
struct FillInfo {
    std::string context;
    std::string orderId;
    OrderSide orderSide;
    std::string contract;
    std::string tokenId;
    std::string amount;
    Amount price;
    std::uint64_t timestamp = 0;
    std::string maker;
    std::string taker;

    bool
    operator==(FillInfo const&) const = default;
};

enum class ApprovalKind : std::uint8_t { BuyApproval, SellApproval };

/**
 * @brief Signals that a maker's approval state should be re-synchronized.
 */
struct MakerInfo {
    struct Data {
        ApprovalKind kind;
        std::string contract;
        OrderKind orderKind;

        bool
        operator==(Data const&) const = default;
    };

    std::string context;
    std::string maker;
    Trigger trigger;
    Data data;

    bool
    operator==(MakerInfo const&) const = default;
};

/**
 * @brief The accumulator filled by normalization.
 *
 * Append-only during a pass. Each list is in the order of the raw events that produced its records.
 */
struct OnChainData {
    std::vector<FillEvent> fillEvents;
    std::vector<NonceCancelEvent> nonceCancelEvents;
    std::vector<BulkCancelEvent> bulkCancelEvents;
    std::vector<OrderInfo> orderInfos;
    std::vector<FillInfo> fillInfos;
    std::vector<MakerInfo> makerInfos;

    /**
     * @brief Moves all records of another accumulator to the end of this one, list by list.
     *
     * @param other The accumulator to drain
     */
    void
    append(OnChainData&& other);

    /**
     * @return The total number of records in all lists
     */
    [[nodiscard]] std::size_t
    size() const;

    /**
     * @return true if no list holds a record; false otherwise
     */
    [[nodiscard]] bool
    empty() const;

    bool
    operator==(OnChainData const&) const = default;
};

// Results of external lookups

/**
 * @brief A marketplace, aggregator or referrer that can be credited for a trade.
 */
struct Source {
    std::int64_t id = 0;
    std::string domain;

    bool
    operator==(Source const&) const = default;
};

struct Attribution {
    std::optional<std::string> taker;
    std::optional<Source> orderSource;
    std::optional<Source> aggregatorSource;
    std::optional<Source> fillSource;

    bool
    operator==(Attribution const&) const = default;
};

struct OrderRef {
    std::string orderId;
};

struct Prices {
    std::optional<Amount> nativePrice;
    std::optional<Amount> usdPrice;

    bool
    operator==(Prices const&) const = default;
};

/**
 * @brief Converts the event kind into its tag, e.g. `looks-rare-v2-taker-bid`.
 *
 * @param kind The event kind
 * @return The tag
 */
[[nodiscard]] std::string_view
toString(EventKind kind);

/**
 * @brief Looks up an event kind by its tag.
 *
 * @param tag The tag, e.g. `looks-rare-v2-taker-bid`
 * @return The kind or std::nullopt if the tag is not known
 */
[[nodiscard]] std::optional<EventKind>
eventKindFromString(std::string_view tag);

[[nodiscard]] std::string_view
toString(OrderKind kind);

[[nodiscard]] std::string_view
toString(OrderSide side);

[[nodiscard]] std::string_view
toString(TriggerKind kind);

[[nodiscard]] std::string_view
toString(ApprovalKind kind);

}  // namespace ingest::model
