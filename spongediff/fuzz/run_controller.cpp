// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <spongediff/core/assert.h>
#include <spongediff/core/result.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/fuzz_config.hpp>
#include <spongediff/fuzz/progress.hpp>
#include <spongediff/fuzz/run_controller.hpp>
#include <spongediff/fuzz/worker.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/channel_op_status.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

namespace
{
    uint64_t worker_seed(std::optional<uint64_t> const &base, size_t const i)
    {
        if (base.has_value()) {
            return *base + i;
        }
        std::random_device rd;
        return (uint64_t{rd()} << 32) | rd();
    }
}

RunController::RunController(
    Config config, CandidateConfig candidate, ProgressSink &progress)
    : config_{std::move(config)}
    , candidate_{std::move(candidate)}
    , progress_{progress}
{
}

Result<void> RunController::run()
{
    BOOST_OUTCOME_TRY(config_.validate());

    size_t const n = config_.worker_count;
    uint64_t const per_worker = config_.iterations_per_worker();

    LOG_INFO(
        "Running {} iterations on {} workers ({} each), inputs shorter than "
        "{} bytes",
        config_.total_iterations,
        n,
        per_worker,
        config_.max_input_bytes);
    if (auto const dropped = config_.dropped_iterations(); dropped != 0) {
        LOG_WARNING(
            "Dropping {} iterations not divisible across {} workers",
            dropped,
            n);
    }

    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers.push_back(std::make_unique<Worker>(
            i,
            per_worker,
            config_.max_input_bytes,
            worker_seed(config_.seed, i),
            candidate_,
            progress_));
    }

    // capacity is a power of two and holds one less element, so no push
    // ever blocks
    std::vector<std::optional<Result<void>>> results(n);
    boost::fibers::buffered_channel<size_t> completed{
        std::max(size_t{2}, std::bit_ceil(n + 1))};

    // declared last so the threads are stopped and joined first
    std::vector<std::jthread> threads;
    threads.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        threads.emplace_back([&, i](std::stop_token const stop) {
            results[i] = workers[i]->run(stop);
            auto const status = completed.push(i);
            SPONGEDIFF_ASSERT(
                status == boost::fibers::channel_op_status::success);
        });
    }

    for (size_t finished = 0; finished < n; ++finished) {
        size_t i;
        auto const status = completed.pop(i);
        SPONGEDIFF_ASSERT(status == boost::fibers::channel_op_status::success);
        auto &result = results[i];
        SPONGEDIFF_ASSERT(result.has_value());
        if (result->has_error()) {
            failure_ = workers[i]->failure();
            SPONGEDIFF_ASSERT(failure_.has_value());
            LOG_ERROR(
                "Worker {} failed: {}",
                i,
                result->error().message().c_str());
            for (auto &thread : threads) {
                thread.request_stop();
            }
            return std::move(*result).error();
        }
        LOG_INFO("Worker {} finished", i);
    }

    return success();
}

SPONGEDIFF_FUZZ_NAMESPACE_END
