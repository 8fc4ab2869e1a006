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

#include "ingest/BatchRunner.hpp"

#include "ingest/DecodeError.hpp"
#include "ingest/Models.hpp"
#include "ingest/NormalizerInterface.hpp"
#include "util/Assert.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/post.hpp>

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <utility>
#include <vector>

namespace ingest {

BatchRunner::BatchRunner(std::shared_ptr<NormalizerInterface> normalizer, std::size_t numWorkers)
    : normalizer_{std::move(normalizer)}, pool_{numWorkers}
{
    ASSERT(normalizer_ != nullptr, "Normalizer must be set");
}

BatchRunner::~BatchRunner()
{
    pool_.join();
}

model::OnChainData
BatchRunner::run(std::vector<model::RawEvent> const& events)
{
    auto groups = groupByTransaction(events);

    std::vector<std::future<model::OnChainData>> results;
    results.reserve(groups.size());

    for (auto& group : groups) {
        auto task = std::make_shared<std::packaged_task<model::OnChainData()>>(
            [normalizer = normalizer_, group = std::move(group)] {
                model::OnChainData data;
                normalizer->normalize(group, data);
                return data;
            }
        );

        results.push_back(task->get_future());
        boost::asio::post(pool_, [task = std::move(task)] { (*task)(); });
    }

    model::OnChainData merged;
    std::exception_ptr unavailable;

    for (auto& result : results) {
        try {
            merged.append(result.get());
        } catch (DecoderRegistryUnavailable const& e) {
            LOG(log_.error()) << "Decoder registry unavailable: " << e.what();
            if (not unavailable)
                unavailable = std::current_exception();
        }
    }

    if (unavailable)
        std::rethrow_exception(unavailable);

    LOG(log_.info()) << "Normalized " << events.size() << " events of " << results.size() << " transactions into "
                     << merged.size() << " records; " << normalizer_->statistics().toString();

    return merged;
}

std::vector<std::vector<model::RawEvent>>
BatchRunner::groupByTransaction(std::vector<model::RawEvent> const& events)
{
    std::vector<std::vector<model::RawEvent>> groups;
    for (auto const& event : events) {
        if (groups.empty() or groups.back().back().origin.txHash != event.origin.txHash)
            groups.emplace_back();

        groups.back().push_back(event);
    }

    return groups;
}

}  // namespace ingest
