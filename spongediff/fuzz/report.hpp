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
#include <spongediff/core/bytes.hpp>
#include <spongediff/fuzz/config.hpp>

#include <evmc/evmc.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

struct DigestPair
{
    bytes32_t reference{};
    bytes32_t candidate{};
};

struct MismatchReport
{
    size_t worker{0};
    uint64_t iteration{0};
    byte_string input{};
    DigestPair digests{};
};

// The candidate failed to produce a digest at all.
struct ExecutionFault
{
    size_t worker{0};
    uint64_t iteration{0};
    byte_string input{};
    std::string error{};
    evmc_status_code status{EVMC_SUCCESS};
};

using Failure = std::variant<MismatchReport, ExecutionFault>;

std::string describe(Failure const &);

SPONGEDIFF_FUZZ_NAMESPACE_END
