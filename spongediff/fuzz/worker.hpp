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

#pragma once

#include <spongediff/core/byte_string.hpp>
#include <spongediff/core/result.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/input_generator.hpp>
#include <spongediff/fuzz/progress.hpp>
#include <spongediff/fuzz/report.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

// Runs a sequential share of iterations against its own candidate. The
// candidate is never reset between iterations.
class Worker
{
    size_t const index_;
    uint64_t const num_iterations_;
    uint64_t const seed_;
    Candidate candidate_;
    InputGenerator generator_;
    ProgressSink &progress_;
    byte_string buffer_{};
    DigestPair digests_{};
    std::optional<Failure> failure_{};

public:
    Worker(
        size_t index, uint64_t num_iterations, size_t max_input_bytes,
        uint64_t seed, CandidateConfig, ProgressSink &);

    /// Stops at the first failure, whose report is then in failure().
    /// Returns FuzzError::Cancelled once a stop is requested.
    Result<void> run(std::stop_token = {});

    /// Compares both digests of one input.
    Result<void> check(uint64_t iteration, byte_string_view input);

    std::optional<Failure> const &failure() const noexcept
    {
        return failure_;
    }

    DigestPair const &digests() const noexcept
    {
        return digests_;
    }
};

SPONGEDIFF_FUZZ_NAMESPACE_END
