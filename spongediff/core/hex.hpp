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

#include <optional>
#include <string>
#include <string_view>

SPONGEDIFF_NAMESPACE_BEGIN

/// Lower case hex with a `0x` prefix. An empty input yields `0x`.
std::string to_hex(byte_string_view);

std::string to_hex(bytes32_t const &);

/// Accepts an optional `0x` prefix and ignores surrounding whitespace.
/// Returns nullopt for odd length or non-hex characters.
std::optional<byte_string> from_hex(std::string_view);

SPONGEDIFF_NAMESPACE_END
