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

#include <spongediff/core/byte_string.hpp>
#include <spongediff/core/hex.hpp>
#include <spongediff/core/keccak.hpp>
#include <spongediff/core/likely.h>
#include <spongediff/core/result.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/error.hpp>
#include <spongediff/fuzz/progress.hpp>
#include <spongediff/fuzz/report.hpp>
#include <spongediff/fuzz/worker.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <utility>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

Worker::Worker(
    size_t const index, uint64_t const num_iterations,
    size_t const max_input_bytes, uint64_t const seed,
    CandidateConfig candidate, ProgressSink &progress)
    : index_{index}
    , num_iterations_{num_iterations}
    , seed_{seed}
    , candidate_{std::move(candidate)}
    , generator_{max_input_bytes, seed}
    , progress_{progress}
{
}

Result<void>
Worker::check(uint64_t const iteration, byte_string_view const input)
{
    keccak256(input, digests_.reference);

    auto candidate = candidate_.hash(input);
    if (SPONGEDIFF_UNLIKELY(candidate.has_error())) {
        failure_ = ExecutionFault{
            .worker = index_,
            .iteration = iteration,
            .input = byte_string{input},
            .error = candidate.error().message().c_str(),
            .status = candidate_.last_status()};
        return std::move(candidate).error();
    }

    digests_.candidate = candidate.value();
    if (SPONGEDIFF_UNLIKELY(digests_.candidate != digests_.reference)) {
        failure_ = MismatchReport{
            .worker = index_,
            .iteration = iteration,
            .input = byte_string{input},
            .digests = digests_};
        return FuzzError::DigestMismatch;
    }
    return success();
}

Result<void> Worker::run(std::stop_token const stop)
{
    LOG_INFO(
        "Worker {} starting {} iterations with seed {}",
        index_,
        num_iterations_,
        seed_);

    for (uint64_t i = 0; i < num_iterations_; ++i) {
        if (stop.stop_requested()) {
            LOG_INFO("Worker {} stopped at iteration {}", index_, i);
            return FuzzError::Cancelled;
        }
        auto const input = generator_.next(buffer_);
        LOG_DEBUG("Worker {} iteration {} input {}", index_, i, to_hex(input));
        BOOST_OUTCOME_TRY(check(i, input));
        progress_.on_progress(index_, i + 1, num_iterations_);
    }

    progress_.on_done(index_);
    return success();
}

SPONGEDIFF_FUZZ_NAMESPACE_END
