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
#include <spongediff/execution/candidate.hpp>
#include <spongediff/execution/candidate_error.hpp>
#include <spongediff/test/test_support.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <test_resource_data.h>

#include <cstddef>
#include <vector>

using namespace spongediff;
using namespace evmc::literals;

namespace
{
    byte_string iota_bytes(size_t const n)
    {
        byte_string out;
        for (size_t i = 0; i < n; ++i) {
            out.push_back(static_cast<unsigned char>(i));
        }
        return out;
    }

    std::vector<byte_string> sample_inputs()
    {
        return {
            byte_string{},
            byte_string{0x01},
            byte_string{to_byte_string_view("abc")},
            iota_bytes(31),
            iota_bytes(32),
            iota_bytes(33),
            iota_bytes(99),
            byte_string(135, 'a'),
            byte_string(136, 'a'),
        };
    }
}

TEST(Candidate, agrees_with_reference)
{
    for (auto const &input : sample_inputs()) {
        Candidate candidate{test::load_candidate(test_resource::stateful_sponge)};
        auto const digest = candidate.hash(input);
        ASSERT_FALSE(digest.has_error()) << to_hex(input);
        EXPECT_EQ(digest.value(), keccak256(input)) << to_hex(input);
    }
}

TEST(Candidate, state_reset_between_inputs)
{
    Candidate candidate{test::load_candidate(test_resource::stateful_sponge)};
    for (auto const &input : sample_inputs()) {
        auto const digest = candidate.hash(input);
        ASSERT_FALSE(digest.has_error()) << to_hex(input);
        EXPECT_EQ(digest.value(), keccak256(input)) << to_hex(input);
    }
    EXPECT_EQ(
        candidate.state().get_storage(candidate.config().address, bytes32_t{}),
        bytes32_t{});
}

TEST(Candidate, deterministic)
{
    auto const input = iota_bytes(77);
    Candidate c1{test::load_candidate(test_resource::stateful_sponge)};
    Candidate c2{test::load_candidate(test_resource::stateful_sponge)};
    auto const d1 = c1.hash(input);
    auto const d2 = c2.hash(input);
    ASSERT_FALSE(d1.has_error());
    ASSERT_FALSE(d2.has_error());
    EXPECT_EQ(d1.value(), d2.value());
}

TEST(Candidate, absorb_concatenates)
{
    byte_string const a(40, 'a');
    byte_string const b(7, 'b');

    Candidate candidate{test::load_candidate(test_resource::stateful_sponge)};
    ASSERT_FALSE(candidate.absorb(a).has_error());
    ASSERT_FALSE(candidate.absorb(b).has_error());
    auto const digest = candidate.squeeze();
    ASSERT_FALSE(digest.has_error());
    EXPECT_EQ(digest.value(), keccak256(a + b));
}

TEST(Candidate, each_call_is_a_transaction)
{
    Candidate candidate{test::load_candidate(test_resource::stateful_sponge)};
    auto const &caller = candidate.config().caller;
    EXPECT_EQ(candidate.state().get_nonce(caller), 0);
    ASSERT_FALSE(candidate.hash(iota_bytes(5)).has_error());
    EXPECT_EQ(candidate.state().get_nonce(caller), 2);
    EXPECT_EQ(candidate.last_status(), EVMC_SUCCESS);
}

TEST(Candidate, leaky_sponge_diverges_on_second_input)
{
    Candidate candidate{test::load_candidate(test_resource::leaky_sponge)};
    auto const first = byte_string{to_byte_string_view("abc")};
    auto const second = byte_string{0x01};

    auto const d1 = candidate.hash(first);
    ASSERT_FALSE(d1.has_error());
    EXPECT_EQ(d1.value(), keccak256(first));

    auto const d2 = candidate.hash(second);
    ASSERT_FALSE(d2.has_error());
    EXPECT_NE(d2.value(), keccak256(second));
    EXPECT_EQ(d2.value(), keccak256(first + second));
}

TEST(Candidate, zero_digest)
{
    Candidate candidate{test::load_candidate(test_resource::zero_digest)};
    auto const digest = candidate.hash(byte_string{0x01});
    ASSERT_FALSE(digest.has_error());
    EXPECT_EQ(digest.value(), bytes32_t{});
}

TEST(Candidate, reverting_absorb)
{
    Candidate candidate{test::load_candidate(test_resource::reverting)};
    auto const res = candidate.hash(byte_string{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), CandidateError::AbsorbFailed);
    EXPECT_EQ(candidate.last_status(), EVMC_REVERT);
}

TEST(Candidate, reverting_squeeze)
{
    Candidate candidate{test::load_candidate(test_resource::squeeze_reverts)};
    ASSERT_FALSE(candidate.absorb(byte_string{0x01}).has_error());
    EXPECT_EQ(candidate.last_status(), EVMC_SUCCESS);

    auto const res = candidate.squeeze();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), CandidateError::SqueezeFailed);
    EXPECT_EQ(candidate.last_status(), EVMC_REVERT);
}

TEST(Candidate, empty_code_has_no_output)
{
    Candidate candidate{CandidateConfig{}};
    ASSERT_FALSE(candidate.absorb(byte_string{0x01}).has_error());
    auto const res = candidate.squeeze();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), CandidateError::InvalidOutput);
}
