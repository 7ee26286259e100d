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
#include <spongediff/core/hex.hpp>
#include <spongediff/core/keccak.hpp>

#include <gtest/gtest.h>

using namespace spongediff;

TEST(Hex, to_hex)
{
    EXPECT_EQ(to_hex(byte_string_view{}), "0x");
    EXPECT_EQ(to_hex(byte_string{0x00, 0xab, 0x01}), "0x00ab01");
    EXPECT_EQ(
        to_hex(NULL_HASH),
        "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Hex, from_hex)
{
    EXPECT_EQ(from_hex("0x00ab01"), (byte_string{0x00, 0xab, 0x01}));
    EXPECT_EQ(from_hex("00AB01"), (byte_string{0x00, 0xab, 0x01}));
    EXPECT_EQ(from_hex("  0X6000\n"), (byte_string{0x60, 0x00}));
    EXPECT_EQ(from_hex("0x"), byte_string{});
    EXPECT_EQ(from_hex(" \n"), byte_string{});
}

TEST(Hex, from_hex_rejects)
{
    EXPECT_FALSE(from_hex("0x600").has_value());
    EXPECT_FALSE(from_hex("0xzz").has_value());
    EXPECT_FALSE(from_hex("60 00").has_value());
}
