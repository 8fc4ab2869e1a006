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
#include "ingest/RegistryInterface.hpp"

#include <concepts>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace ingest::impl {

template <typename T>
concept HasBidAskNoncesHook = requires(T p, EventContext& ctx) {
    { p.onEvent(ctx, std::declval<model::BidAskNonces const&>()) } -> std::same_as<void>;
};

template <typename T>
concept HasNoncesCancelledHook = requires(T p, EventContext& ctx) {
    { p.onEvent(ctx, std::declval<model::NoncesCancelled const&>()) } -> std::same_as<void>;
};

template <typename T>
concept HasTakerTradeHook = requires(T p, EventContext& ctx) {
    { p.onEvent(ctx, std::declval<model::TakerTrade const&>()) } -> std::same_as<void>;
};

template <typename T>
concept ContainsSpec = std::decay_t<T>::spec::kSPEC_TAG;

template <typename T>
concept ContainsValidHook = HasBidAskNoncesHook<T> or HasNoncesCancelledHook<T> or HasTakerTradeHook<T>;

template <typename T>
concept SomeRule = ContainsSpec<T> and ContainsValidHook<T>;

/**
 * @brief Compile-time list of rules with a spec-filtered dispatch.
 */
template <SomeRule... Ps>
class Registry : public RegistryInterface {
    std::tuple<Ps...> store_;

public:
    explicit constexpr Registry(SomeRule auto&&... rules)
        requires(std::is_same_v<std::decay_t<decltype(rules)>, std::decay_t<Ps>> and ...)
        : store_(std::forward<decltype(rules)>(rules)...)
    {
    }

    ~Registry() override = default;
    Registry(Registry const&) = delete;
    Registry(Registry&&) = default;
    Registry&
    operator=(Registry const&) = delete;
    Registry&
    operator=(Registry&&) = default;

    [[nodiscard]] bool
    handles(model::EventKind kind) const override
    {
        return (std::decay_t<Ps>::spec::wants(kind) or ...);
    }

    void
    dispatch(EventContext& ctx, model::DecodedEvent const& decoded) override
    {
        std::visit(
            [&](auto const& event) {
                auto const expand = [&]<typename P>(P& p) {
                    if constexpr (requires { p.onEvent(ctx, event); }) {
                        if (std::decay_t<P>::spec::wants(ctx.event.kind))
                            p.onEvent(ctx, event);
                    }
                };

                std::apply([&expand](auto&... xs) { (expand(xs), ...); }, store_);
            },
            decoded
        );
    }
};

}  // namespace ingest::impl
