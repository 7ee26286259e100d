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
#include <spongediff/core/bytes.hpp>
#include <spongediff/core/config.hpp>
#include <spongediff/core/keccak.hpp>

#include <ethash/keccak.hpp>

#include <bit>
#include <cstring>

SPONGEDIFF_NAMESPACE_BEGIN

static_assert(sizeof(ethash::hash256) == KECCAK256_SIZE);
static_assert(sizeof(bytes32_t) == KECCAK256_SIZE);

void keccak256(byte_string_view const in, bytes32_t &out) noexcept
{
    auto const hashed = ethash::keccak256(in.data(), in.size());
    std::memcpy(out.bytes, hashed.bytes, sizeof(out.bytes));
}

bytes32_t keccak256(byte_string_view const in) noexcept
{
    return std::bit_cast<bytes32_t>(ethash::keccak256(in.data(), in.size()));
}

SPONGEDIFF_NAMESPACE_END
