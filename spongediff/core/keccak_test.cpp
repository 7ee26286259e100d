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
#include <spongediff/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace spongediff;
using namespace evmc::literals;

TEST(Keccak, empty_input)
{
    EXPECT_EQ(keccak256(byte_string_view{}), NULL_HASH);
}

TEST(Keccak, abc)
{
    EXPECT_EQ(
        keccak256(to_byte_string_view("abc")),
        0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45_bytes32);
}

TEST(Keccak, single_byte)
{
    unsigned char const one = 0x01;
    EXPECT_EQ(
        keccak256(byte_string_view{&one, 1}),
        0x5fe7f977e71dba2ea1a68e21057beebb9be2ac30c6410aa38d4f3fbe41dcffd2_bytes32);
}

// 136 bytes is the keccak256 rate, padding moves to an extra block
TEST(Keccak, rate_boundary)
{
    std::string const a135(135, 'a');
    std::string const a136(136, 'a');

    EXPECT_EQ(
        keccak256(to_byte_string_view(a135)),
        0x34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf446_bytes32);
    EXPECT_EQ(
        keccak256(to_byte_string_view(a136)),
        0xa6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e_bytes32);
}

TEST(Keccak, out_parameter)
{
    byte_string input;
    for (unsigned i = 0; i < 100; ++i) {
        input.push_back(static_cast<unsigned char>(i));
    }

    bytes32_t out{};
    keccak256(input, out);
    EXPECT_EQ(
        out,
        0x816afb32e7661842252bc955167ea1e36fde4ac8cfe932978b9dcdb04aee8ca4_bytes32);

    // same input, same digest, nothing else touched
    bytes32_t again = NULL_HASH;
    keccak256(input, again);
    EXPECT_EQ(again, out);
}
