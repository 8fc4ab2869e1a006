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

#include "util/Assert.hpp"

#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

namespace ingest::model {

namespace {

struct EventKindTag {
    EventKind kind;
    std::string_view tag;
};

constexpr auto kEVENT_KIND_TAGS = std::array{
    EventKindTag{.kind = EventKind::LooksRareV2NewBidAskNonces, .tag = "looks-rare-v2-new-bid-ask-nonces"},
    EventKindTag{.kind = EventKind::LooksRareV2SubsetNoncesCancelled, .tag = "looks-rare-v2-subset-nonces-cancelled"},
    EventKindTag{.kind = EventKind::LooksRareV2OrderNoncesCancelled, .tag = "looks-rare-v2-order-nonces-cancelled"},
    EventKindTag{.kind = EventKind::LooksRareV2TakerAsk, .tag = "looks-rare-v2-taker-ask"},
    EventKindTag{.kind = EventKind::LooksRareV2TakerBid, .tag = "looks-rare-v2-taker-bid"},
    EventKindTag{.kind = EventKind::Erc20Transfer, .tag = "erc20-transfer"},
    EventKindTag{.kind = EventKind::Erc721Transfer, .tag = "erc721-transfer"},
    EventKindTag{.kind = EventKind::Other, .tag = "other"},
};

template <typename T>
void
moveAppend(std::vector<T>& to, std::vector<T>& from)
{
    to.reserve(to.size() + from.size());
    std::move(from.begin(), from.end(), std::back_inserter(to));
    from.clear();
}

}  // namespace

void
OnChainData::append(OnChainData&& other)
{
    moveAppend(fillEvents, other.fillEvents);
    moveAppend(nonceCancelEvents, other.nonceCancelEvents);
    moveAppend(bulkCancelEvents, other.bulkCancelEvents);
    moveAppend(orderInfos, other.orderInfos);
    moveAppend(fillInfos, other.fillInfos);
    moveAppend(makerInfos, other.makerInfos);
}

std::size_t
OnChainData::size() const
{
    return fillEvents.size() + nonceCancelEvents.size() + bulkCancelEvents.size() + orderInfos.size() +
        fillInfos.size() + makerInfos.size();
}

bool
OnChainData::empty() const
{
    return size() == 0uz;
}

std::string_view
toString(EventKind kind)
{
    for (auto const& entry : kEVENT_KIND_TAGS) {
        if (entry.kind == kind)
            return entry.tag;
    }

    ASSERT(false, "Unknown event kind {}", static_cast<int>(kind));
    std::unreachable();
}

std::optional<EventKind>
eventKindFromString(std::string_view tag)
{
    for (auto const& entry : kEVENT_KIND_TAGS) {
        if (entry.tag == tag)
            return entry.kind;
    }
    return std::nullopt;
}

std::string_view
toString(OrderKind kind)
{
    switch (kind) {
        case OrderKind::LooksRareV2:
            return "looks-rare-v2";
    }

    ASSERT(false, "Unknown order kind {}", static_cast<int>(kind));
    std::unreachable();
}

std::string_view
toString(OrderSide side)
{
    return side == OrderSide::Buy ? "buy" : "sell";
}

std::string_view
toString(TriggerKind kind)
{
    switch (kind) {
        case TriggerKind::Sale:
            return "sale";
        case TriggerKind::Cancel:
            return "cancel";
        case TriggerKind::ApprovalChange:
            return "approval-change";
    }

    ASSERT(false, "Unknown trigger kind {}", static_cast<int>(kind));
    std::unreachable();
}

std::string_view
toString(ApprovalKind kind)
{
    return kind == ApprovalKind::BuyApproval ? "buy-approval" : "sell-approval";
}

}  // namespace ingest::model
