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
#include <spongediff/core/int.hpp>
#include <spongediff/core/result.hpp>
#include <spongediff/execution/abi.hpp>
#include <spongediff/execution/candidate.hpp>
#include <spongediff/execution/candidate_error.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmone/evmone.h>

#include <intx/intx.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <limits>
#include <utility>

SPONGEDIFF_NAMESPACE_BEGIN

namespace
{
    constexpr int64_t UNLIMITED_GAS = std::numeric_limits<int64_t>::max();

    evmc_tx_context make_tx_context(Address const &origin)
    {
        evmc_tx_context ctx{};
        ctx.tx_origin = origin;
        ctx.block_gas_limit = UNLIMITED_GAS;
        ctx.chain_id = intx::be::store<evmc_uint256be>(uint256_t{1});
        return ctx;
    }
}

Candidate::Candidate(CandidateConfig config)
    : config_{std::move(config)}
    , vm_{evmc_create_evmone()}
    , tx_context_{make_tx_context(config_.caller)}
    , host_{state_, vm_, config_.revision, tx_context_}
{
    state_.deploy(config_.address, config_.code);
}

// Runs calldata_ as one committed transaction from the caller to the
// deployed contract. The frame is rolled back by the host on failure; the
// nonce bump stays.
evmc::Result Candidate::transact()
{
    state_.begin_transaction();
    state_.set_nonce(config_.caller, state_.get_nonce(config_.caller) + 1);
    state_.access_account(config_.caller);
    state_.access_account(config_.address);

    evmc_message const msg{
        .kind = EVMC_CALL,
        .gas = UNLIMITED_GAS,
        .recipient = config_.address,
        .sender = config_.caller,
        .input_data = calldata_.data(),
        .input_size = calldata_.size(),
        .code_address = config_.address,
    };

    auto result = host_.call(msg);
    last_status_ = result.status_code;
    return result;
}

Result<void> Candidate::absorb(byte_string_view const input)
{
    calldata_.clear();
    abi_encode_absorb(input, calldata_);
    auto const result = transact();
    if (result.status_code != EVMC_SUCCESS) {
        return CandidateError::AbsorbFailed;
    }
    return success();
}

Result<bytes32_t> Candidate::squeeze()
{
    calldata_.clear();
    abi_encode_squeeze(calldata_);
    auto const result = transact();
    if (result.status_code != EVMC_SUCCESS) {
        return CandidateError::SqueezeFailed;
    }
    return abi_decode_bytes32({result.output_data, result.output_size});
}

Result<bytes32_t> Candidate::hash(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(absorb(input));
    return squeeze();
}

SPONGEDIFF_NAMESPACE_END
