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
#include <spongediff/core/hex.hpp>

#include <evmc/hex.hpp>

#include <optional>
#include <string>
#include <string_view>

SPONGEDIFF_NAMESPACE_BEGIN

std::string to_hex(byte_string_view const bytes)
{
    return "0x" + evmc::hex(bytes);
}

std::string to_hex(bytes32_t const &value)
{
    return to_hex(byte_string_view{value.bytes, sizeof(value.bytes)});
}

std::optional<byte_string> from_hex(std::string_view hex)
{
    constexpr std::string_view whitespace{" \t\r\n"};

    auto const begin = hex.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return byte_string{};
    }
    hex = hex.substr(begin, hex.find_last_not_of(whitespace) - begin + 1);
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    return evmc::from_hex(hex);
}

SPONGEDIFF_NAMESPACE_END
