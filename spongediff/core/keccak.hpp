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
#include <spongediff/core/config.hpp>

#include <cstddef>

SPONGEDIFF_NAMESPACE_BEGIN

inline constexpr size_t KECCAK256_SIZE = 32;

namespace detail
{
    using namespace ::evmc::literals;

    // keccak256 of the empty string
    inline constexpr bytes32_t NULL_HASH =
        0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32;
}

using detail::NULL_HASH;

/// Reference hasher. Writes the digest of `in` into `out` and nothing else.
void keccak256(byte_string_view in, bytes32_t &out) noexcept;

bytes32_t keccak256(byte_string_view in) noexcept;

SPONGEDIFF_NAMESPACE_END
