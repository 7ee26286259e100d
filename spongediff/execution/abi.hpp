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
#include <spongediff/core/result.hpp>

#include <cstdint>
#include <string_view>

SPONGEDIFF_NAMESPACE_BEGIN

/// First four bytes of the keccak256 of a canonical function signature,
/// e.g. "absorb(bytes)".
uint32_t function_selector(std::string_view signature) noexcept;

/// Appends the calldata of `absorb(bytes)` to `out`: selector, head offset,
/// length word and `data` zero padded to a multiple of 32 bytes.
void abi_encode_absorb(byte_string_view data, byte_string &out);

void abi_encode_squeeze(byte_string &out);

/// First 32 bytes of a call output. Fails with
/// CandidateError::InvalidOutput on shorter output.
Result<bytes32_t> abi_decode_bytes32(byte_string_view output);

SPONGEDIFF_NAMESPACE_END
