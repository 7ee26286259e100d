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
#include <spongediff/core/result.hpp>
#include <spongediff/execution/abi.hpp>
#include <spongediff/execution/candidate_error.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

SPONGEDIFF_NAMESPACE_BEGIN

namespace
{
    constexpr size_t WORD_SIZE = 32;

    void append_selector(uint32_t const selector, byte_string &out)
    {
        unsigned char buf[4];
        intx::be::unsafe::store(buf, selector);
        out.append(buf, sizeof(buf));
    }

    void append_word(uint64_t const value, byte_string &out)
    {
        bytes32_t word{};
        intx::be::unsafe::store(word.bytes + WORD_SIZE - 8, value);
        out.append(word.bytes, WORD_SIZE);
    }
}

uint32_t function_selector(std::string_view const signature) noexcept
{
    auto const hash = keccak256(to_byte_string_view(signature));
    return intx::be::unsafe::load<uint32_t>(hash.bytes);
}

void abi_encode_absorb(byte_string_view const data, byte_string &out)
{
    static uint32_t const selector = function_selector("absorb(bytes)");

    append_selector(selector, out);
    append_word(WORD_SIZE, out);
    append_word(data.size(), out);
    out.append(data);
    if (auto const rem = data.size() % WORD_SIZE; rem != 0) {
        out.append(WORD_SIZE - rem, 0);
    }
}

void abi_encode_squeeze(byte_string &out)
{
    static uint32_t const selector = function_selector("squeeze()");

    append_selector(selector, out);
}

Result<bytes32_t> abi_decode_bytes32(byte_string_view const output)
{
    if (output.size() < sizeof(bytes32_t)) {
        return CandidateError::InvalidOutput;
    }
    bytes32_t result;
    std::memcpy(result.bytes, output.data(), sizeof(bytes32_t));
    return result;
}

SPONGEDIFF_NAMESPACE_END
