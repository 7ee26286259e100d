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

#include <spongediff/core/bytes.hpp>
#include <spongediff/core/config.hpp>
#include <spongediff/core/int.hpp>
#include <spongediff/core/keccak.hpp>

#include <cstdint>

SPONGEDIFF_NAMESPACE_BEGIN

struct Account
{
    uint256_t balance{0};
    bytes32_t code_hash{NULL_HASH};
    uint64_t nonce{0};

    friend bool operator==(Account const &, Account const &) = default;
};

SPONGEDIFF_NAMESPACE_END
