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

#include "ingest/ModelsJson.hpp"

#include "ingest/Models.hpp"
#include "util/Hex.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/array.hpp>
#include <boost/json/conversion.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ingest::model {

namespace {

boost::json::value
amountToJson(Amount const& amount)
{
    return boost::json::value(amount.str());
}

template <typename T>
boost::json::value
optionalToJson(std::optional<T> const& value)
{
    if (value.has_value())
        return boost::json::value_from(*value);
    return nullptr;
}

template <>
boost::json::value
optionalToJson(std::optional<Amount> const& value)
{
    if (value.has_value())
        return amountToJson(*value);
    return nullptr;
}

std::string
stringAt(boost::json::object const& object, char const* key)
{
    return boost::json::value_to<std::string>(object.at(key));
}

}  // namespace

OriginParams
tag_invoke(boost::json::value_to_tag<OriginParams>, boost::json::value const& jv)
{
    auto const& object = jv.as_object();

    OriginParams origin;
    origin.txHash = util::toLowerHex(stringAt(object, "tx_hash"));
    origin.blockHash = util::toLowerHex(stringAt(object, "block_hash"));
    origin.block = boost::json::value_to<std::uint64_t>(object.at("block"));
    origin.logIndex = boost::json::value_to<std::uint32_t>(object.at("log_index"));
    origin.timestamp = boost::json::value_to<std::uint64_t>(object.at("timestamp"));
    origin.contractAddress = util::toLowerHex(stringAt(object, "contract_address"));

    if (object.contains("batch_index"))
        origin.batchIndex = boost::json::value_to<std::uint32_t>(object.at("batch_index"));

    return origin;
}

RawLog
tag_invoke(boost::json::value_to_tag<RawLog>, boost::json::value const& jv)
{
    auto const& object = jv.as_object();

    RawLog log;
    log.address = util::toLowerHex(stringAt(object, "address"));
    for (auto const& topic : object.at("topics").as_array())
        log.topics.push_back(util::toLowerHex(boost::json::value_to<std::string>(topic)));

    auto data = util::fromHex(stringAt(object, "data"));
    if (not data.has_value())
        throw std::invalid_argument("Log data is not hex");

    log.data = std::move(data).value();
    return log;
}

RawEvent
tag_invoke(boost::json::value_to_tag<RawEvent>, boost::json::value const& jv)
{
    auto const& object = jv.as_object();

    auto tag = stringAt(object, "kind");
    auto const kind = eventKindFromString(tag);

    return {
        .kind = kind.value_or(EventKind::Other),
        .origin = boost::json::value_to<OriginParams>(object.at("origin")),
        .log = boost::json::value_to<RawLog>(object.at("log")),
        .otherKind = kind.has_value() ? std::string{} : std::move(tag),
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, OriginParams const& origin)
{
    jv = boost::json::object{
        {"tx_hash", origin.txHash},
        {"block_hash", origin.blockHash},
        {"block", origin.block},
        {"log_index", origin.logIndex},
        {"batch_index", origin.batchIndex},
        {"timestamp", origin.timestamp},
        {"contract_address", origin.contractAddress},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, RawLog const& log)
{
    jv = boost::json::object{
        {"address", log.address},
        {"topics", boost::json::value_from(log.topics)},
        {"data", util::toHex(log.data)},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, RawEvent const& event)
{
    jv = boost::json::object{
        {"kind", event.otherKind.empty() ? toString(event.kind) : std::string_view{event.otherKind}},
        {"origin", boost::json::value_from(event.origin)},
        {"log", boost::json::value_from(event.log)},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, FillEvent const& fill)
{
    jv = boost::json::object{
        {"order_kind", toString(fill.orderKind)},
        {"order_id", fill.orderId},
        {"order_side", toString(fill.orderSide)},
        {"maker", fill.maker},
        {"taker", fill.taker},
        {"price", amountToJson(fill.price)},
        {"currency", fill.currency},
        {"currency_price", amountToJson(fill.currencyPrice)},
        {"usd_price", optionalToJson(fill.usdPrice)},
        {"contract", fill.contract},
        {"token_id", fill.tokenId},
        {"amount", fill.amount},
        {"order_source_id", optionalToJson(fill.orderSourceId)},
        {"aggregator_source_id", optionalToJson(fill.aggregatorSourceId)},
        {"fill_source_id", optionalToJson(fill.fillSourceId)},
        {"origin", boost::json::value_from(fill.origin)},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, NonceCancelEvent const& cancel)
{
    jv = boost::json::object{
        {"order_kind", toString(cancel.orderKind)},
        {"maker", cancel.maker},
        {"nonce", amountToJson(cancel.nonce)},
        {"is_subset", cancel.isSubset},
        {"origin", boost::json::value_from(cancel.origin)},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, BulkCancelEvent const& cancel)
{
    jv = boost::json::object{
        {"order_kind", toString(cancel.orderKind)},
        {"maker", cancel.maker},
        {"min_nonce", amountToJson(cancel.minNonce)},
        {"order_side", toString(cancel.orderSide)},
        {"across_all", cancel.acrossAll},
        {"origin", boost::json::value_from(cancel.origin)},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, Trigger const& trigger)
{
    jv = boost::json::object{
        {"kind", toString(trigger.kind)},
        {"tx_hash", trigger.txHash},
        {"tx_timestamp", trigger.txTimestamp},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, OrderInfo const& info)
{
    jv = boost::json::object{
        {"context", info.context},
        {"id", info.orderId},
        {"trigger", boost::json::value_from(info.trigger)},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, FillInfo const& info)
{
    jv = boost::json::object{
        {"context", info.context},
        {"order_id", info.orderId},
        {"order_side", toString(info.orderSide)},
        {"contract", info.contract},
        {"token_id", info.tokenId},
        {"amount", info.amount},
        {"price", amountToJson(info.price)},
        {"timestamp", info.timestamp},
        {"maker", info.maker},
        {"taker", info.taker},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, MakerInfo const& info)
{
    jv = boost::json::object{
        {"context", info.context},
        {"maker", info.maker},
        {"trigger", boost::json::value_from(info.trigger)},
        {"data",
         boost::json::object{
             {"kind", toString(info.data.kind)},
             {"contract", info.data.contract},
             {"order_kind", toString(info.data.orderKind)},
         }},
    };
}

void
tag_invoke(boost::json::value_from_tag, boost::json::value& jv, OnChainData const& data)
{
    jv = boost::json::object{
        {"fill_events", boost::json::value_from(data.fillEvents)},
        {"nonce_cancel_events", boost::json::value_from(data.nonceCancelEvents)},
        {"bulk_cancel_events", boost::json::value_from(data.bulkCancelEvents)},
        {"order_infos", boost::json::value_from(data.orderInfos)},
        {"fill_infos", boost::json::value_from(data.fillInfos)},
        {"maker_infos", boost::json::value_from(data.makerInfos)},
    };
}

}  // namespace ingest::model

namespace ingest {

std::expected<std::vector<model::RawEvent>, std::string>
readRawEvents(boost::json::value const& json)
{
    static util::Logger const logger{"Sync"};

    if (not json.is_array())
        return std::unexpected{std::string{"Expected an array of events"}};

    std::vector<model::RawEvent> events;
    auto const& array = json.as_array();
    events.reserve(array.size());

    for (std::size_t index = 0; index < array.size(); ++index) {
        auto const& entry = array.at(index);

        try {
            auto event = boost::json::value_to<model::RawEvent>(entry);
            if (event.kind == model::EventKind::Other) {
                LOG(logger.debug()) << "Event " << index << " has unknown kind '" << event.otherKind
                                    << "'; only its log is used";
            }

            events.push_back(std::move(event));
        } catch (std::exception const& e) {
            return std::unexpected{fmt::format("Event {} is invalid: {}", index, e.what())};
        }
    }

    return events;
}

}  // namespace ingest
