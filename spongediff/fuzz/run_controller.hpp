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

#include <spongediff/core/result.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/fuzz_config.hpp>
#include <spongediff/fuzz/progress.hpp>
#include <spongediff/fuzz/report.hpp>

#include <optional>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

// Splits the run across one thread per worker and surfaces the first
// failure in completion order. Remaining workers are stopped and joined
// before run() returns.
class RunController
{
    Config const config_;
    CandidateConfig const candidate_;
    ProgressSink &progress_;
    std::optional<Failure> failure_{};

public:
    RunController(Config, CandidateConfig, ProgressSink &);

    Result<void> run();

    std::optional<Failure> const &failure() const noexcept
    {
        return failure_;
    }
};

SPONGEDIFF_FUZZ_NAMESPACE_END
