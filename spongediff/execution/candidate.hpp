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
#include <spongediff/execution/evmc_host.hpp>
#include <spongediff/execution/execution_state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

SPONGEDIFF_NAMESPACE_BEGIN

namespace detail
{
    using namespace ::evmc::literals;

    inline constexpr Address DEFAULT_CANDIDATE_ADDRESS =
        0xdead00000000000000000000000000000000beef_address;
}

struct CandidateConfig
{
    Address address{detail::DEFAULT_CANDIDATE_ADDRESS};
    byte_string code{};
    evmc_revision revision{EVMC_CANCUN};
    Address caller{};
};

// A sponge contract deployed into a private in-memory chain. Storage
// persists across calls, so a contract that fails to reset itself on
// squeeze keeps leaking into the next digest.
class Candidate
{
    CandidateConfig const config_;
    evmc::VM vm_;
    ExecutionState state_{};
    evmc_tx_context tx_context_;
    EvmcHost host_;
    evmc_status_code last_status_{EVMC_SUCCESS};
    byte_string calldata_{};

    evmc::Result transact();

public:
    explicit Candidate(CandidateConfig);
    Candidate(Candidate const &) = delete;
    Candidate &operator=(Candidate const &) = delete;

    Result<void> absorb(byte_string_view input);
    Result<bytes32_t> squeeze();

    /// absorb followed by squeeze
    Result<bytes32_t> hash(byte_string_view input);

    evmc_status_code last_status() const noexcept
    {
        return last_status_;
    }

    CandidateConfig const &config() const noexcept
    {
        return config_;
    }

    ExecutionState const &state() const noexcept
    {
        return state_;
    }
};

SPONGEDIFF_NAMESPACE_END
