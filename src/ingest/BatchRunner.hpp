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
#include "ingest/NormalizerInterface.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace ingest {

/**
 * @brief Normalizes the transactions of a batch in parallel.
 *
 * The batch is cut into runs of consecutive events sharing a transaction. Each run is normalized on its own into its
 * own accumulator and the accumulators are merged in input order, so the result equals a sequential pass.
 */
class BatchRunner {
    util::Logger log_{"Sync"};
    std::shared_ptr<NormalizerInterface> normalizer_;
    boost::asio::thread_pool pool_;

public:
    BatchRunner(std::shared_ptr<NormalizerInterface> normalizer, std::size_t numWorkers);

    ~BatchRunner();

    BatchRunner(BatchRunner const&) = delete;
    BatchRunner&
    operator=(BatchRunner const&) = delete;

    /**
     * @brief Normalize a batch.
     *
     * @param events The raw events in chain order
     * @return The canonical records
     * @throws DecoderRegistryUnavailable after all transactions finished, if any of them hit it
     */
    [[nodiscard]] model::OnChainData
    run(std::vector<model::RawEvent> const& events);

    /**
     * @brief Cut a batch into runs of consecutive events of the same transaction.
     *
     * @param events The raw events
     * @return The runs, in input order
     */
    [[nodiscard]] static std::vector<std::vector<model::RawEvent>>
    groupByTransaction(std::vector<model::RawEvent> const& events);
};

}  // namespace ingest
