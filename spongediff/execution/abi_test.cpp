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
#include <spongediff/execution/abi.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

using namespace spongediff;
using namespace evmc::literals;

TEST(Abi, function_selector)
{
    EXPECT_EQ(function_selector("absorb(bytes)"), 0xee151504);
    EXPECT_EQ(function_selector("squeeze()"), 0x857c201f);
    EXPECT_EQ(function_selector("transfer(address,uint256)"), 0xa9059cbb);
}

TEST(Abi, encode_squeeze)
{
    byte_string out;
    abi_encode_squeeze(out);
    EXPECT_EQ(to_hex(out), "0x857c201f");
}

TEST(Abi, encode_absorb_empty)
{
    byte_string out;
    abi_encode_absorb({}, out);
    EXPECT_EQ(
        to_hex(out),
        "0xee151504"
        "0000000000000000000000000000000000000000000000000000000000000020"
        "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST(Abi, encode_absorb_pads_data)
{
    byte_string out;
    abi_encode_absorb(to_byte_string_view("abc"), out);
    EXPECT_EQ(out.size(), 4 + 3 * 32);
    EXPECT_EQ(
        to_hex(out),
        "0xee151504"
        "0000000000000000000000000000000000000000000000000000000000000020"
        "0000000000000000000000000000000000000000000000000000000000000003"
        "6162630000000000000000000000000000000000000000000000000000000000");

    out.clear();
    byte_string const word(32, 0xff);
    abi_encode_absorb(word, out);
    EXPECT_EQ(out.size(), 4 + 3 * 32);
}

TEST(Abi, decode_bytes32)
{
    byte_string output(40, 0x11);
    auto const result = abi_decode_bytes32(output);
    ASSERT_FALSE(result.has_error());
    EXPECT_EQ(
        result.value(),
        0x1111111111111111111111111111111111111111111111111111111111111111_bytes32);

    EXPECT_TRUE(abi_decode_bytes32(byte_string(31, 0x11)).has_error());
    EXPECT_TRUE(abi_decode_bytes32({}).has_error());
}
