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
#include <spongediff/core/byte_string.hpp>
#include <spongediff/fuzz/config.hpp>
#include <spongediff/fuzz/input_generator.hpp>

#include <cstddef>
#include <cstdint>

SPONGEDIFF_FUZZ_NAMESPACE_BEGIN

InputGenerator::InputGenerator(size_t const max_input_bytes, uint64_t const seed)
    : engine_{seed}
    , length_{0, max_input_bytes - 1}
{
    SPONGEDIFF_ASSERT(max_input_bytes > 0);
}

byte_string_view InputGenerator::next(byte_string &buffer)
{
    size_t const length = length_(engine_);
    if (buffer.size() < length) {
        buffer.resize(length);
    }
    for (size_t i = 0; i < length; ++i) {
        buffer[i] = static_cast<unsigned char>(byte_(engine_));
    }
    return byte_string_view{buffer.data(), length};
}

SPONGEDIFF_FUZZ_NAMESPACE_END
