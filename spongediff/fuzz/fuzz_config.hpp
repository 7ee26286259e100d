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
#include <spongediff/fuzz/config.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

struct Config
{
    size_t worker_count{4};
    uint64_t total_iterations{100000};
    // exclusive upper bound on the generated input length
    size_t max_input_bytes{100};
    // worker i seeds its engine with seed + i
    std::optional<uint64_t> seed{};
    uint64_t progress_interval{10000};

    Result<void> validate() const;

    uint64_t iterations_per_worker() const noexcept;

    // iterations lost to the integer division across workers
    uint64_t dropped_iterations() const noexcept;
};

/// Decodes candidate code from hex text, see from_hex.
Result<byte_string> decode_code(std::string_view hex);

Result<byte_string> load_code(std::filesystem::path const &);

SPONGEDIFF_FUZZ_NAMESPACE_END
