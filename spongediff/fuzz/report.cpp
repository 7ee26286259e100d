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

#include <spongediff/core/hex.hpp>
#include <spongediff/execution/status.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/report.hpp>

#include <format>
#include <string>
#include <variant>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

namespace
{
    std::string describe_one(MismatchReport const &r)
    {
        return std::format(
            "Hash mismatch in worker {} at iteration {} - input: {} "
            "reference: {} candidate: {}",
            r.worker,
            r.iteration,
            to_hex(r.input),
            to_hex(r.digests.reference),
            to_hex(r.digests.candidate));
    }

    std::string describe_one(ExecutionFault const &f)
    {
        auto message = std::format(
            "Candidate fault in worker {} at iteration {} - input: {} "
            "error: {}",
            f.worker,
            f.iteration,
            to_hex(f.input),
            f.error);
        // the call itself succeeded when only its output was unusable
        if (f.status != EVMC_SUCCESS) {
            message += std::format(" status: {}", to_string(f.status));
        }
        return message;
    }
}

std::string describe(Failure const &failure)
{
    return std::visit(
        [](auto const &f) { return describe_one(f); }, failure);
}

SPONGEDIFF_FUZZ_NAMESPACE_END
