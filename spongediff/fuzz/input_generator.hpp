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
#include <spongediff/fuzz/config.hpp>

#include <cstddef>
#include <cstdint>
#include <random>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

using random_engine_t = std::mt19937_64;

// Random inputs with a length uniform in [0, max_input_bytes).
class InputGenerator
{
    random_engine_t engine_;
    std::uniform_int_distribution<size_t> length_;
    std::uniform_int_distribution<unsigned> byte_{0, 0xff};

public:
    InputGenerator(size_t max_input_bytes, uint64_t seed);

    /// Fills the front of `buffer` and returns a view of exactly the
    /// generated bytes. The buffer is grown as needed and never shrunk.
    byte_string_view next(byte_string &buffer);

    size_t max_input_bytes() const noexcept
    {
        return length_.max() + 1;
    }
};

SPONGEDIFF_FUZZ_NAMESPACE_END
