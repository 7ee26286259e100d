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

#include <spongediff/core/assert.h>
#include <spongediff/core/bytes.hpp>
#include <spongediff/core/config.hpp>
#include <spongediff/core/int.hpp>
#include <spongediff/core/likely.h>
#include <spongediff/execution/evmc_host.hpp>
#include <spongediff/execution/execution_state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

SPONGEDIFF_NAMESPACE_BEGIN

EvmcHost::EvmcHost(
    ExecutionState &state, evmc::VM &vm, evmc_revision const rev,
    evmc_tx_context const &tx_context) noexcept
    : state_{state}
    , vm_{vm}
    , rev_{rev}
    , tx_context_{tx_context}
{
}

bool EvmcHost::account_exists(Address const &address) const noexcept
{
    return state_.account_exists(address);
}

bytes32_t EvmcHost::get_storage(
    Address const &address, bytes32_t const &key) const noexcept
{
    return state_.get_storage(address, key);
}

evmc_storage_status EvmcHost::set_storage(
    Address const &address, bytes32_t const &key,
    bytes32_t const &value) noexcept
{
    return state_.set_storage(address, key, value);
}

evmc::uint256be EvmcHost::get_balance(Address const &address) const noexcept
{
    return intx::be::store<evmc::uint256be>(state_.get_balance(address));
}

size_t EvmcHost::get_code_size(Address const &address) const noexcept
{
    return state_.get_code_size(address);
}

bytes32_t EvmcHost::get_code_hash(Address const &address) const noexcept
{
    return state_.get_code_hash(address);
}

size_t EvmcHost::copy_code(
    Address const &address, size_t const offset, uint8_t *const data,
    size_t const size) const noexcept
{
    return state_.copy_code(address, offset, data, size);
}

bool EvmcHost::selfdestruct(Address const &, Address const &) noexcept
{
    return false;
}

// Balance checks are disabled: a sender short of funds is topped up first.
void EvmcHost::transfer_value(evmc_message const &msg)
{
    uint256_t const value = intx::be::load<uint256_t>(msg.value);
    if (value == 0) {
        return;
    }
    auto const balance = state_.get_balance(msg.sender);
    if (balance < value) {
        state_.add_to_balance(msg.sender, value - balance);
    }
    state_.subtract_from_balance(msg.sender, value);
    state_.add_to_balance(msg.recipient, value);
}

evmc::Result EvmcHost::call(evmc_message const &msg) noexcept
{
    if (msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2) {
        return evmc::Result{EVMC_FAILURE, 0, 0, nullptr, 0};
    }
    if (SPONGEDIFF_UNLIKELY(msg.depth > max_call_depth)) {
        return evmc::Result{EVMC_CALL_DEPTH_EXCEEDED, 0, 0, nullptr, 0};
    }

    auto checkpoint = state_.checkpoint();

    if (msg.kind == EVMC_CALL || msg.kind == EVMC_CALLCODE) {
        transfer_value(msg);
    }

    auto const code = state_.get_code(msg.code_address);
    auto result =
        code.empty()
            ? evmc::Result{EVMC_SUCCESS, msg.gas, 0, nullptr, 0}
            : vm_.execute(*this, rev_, msg, code.data(), code.size());

    if (result.status_code != EVMC_SUCCESS) {
        state_.revert(std::move(checkpoint));
    }
    return result;
}

evmc_tx_context EvmcHost::get_tx_context() const noexcept
{
    return tx_context_;
}

bytes32_t EvmcHost::get_block_hash(int64_t const block_number) const noexcept
{
    SPONGEDIFF_ASSERT(block_number >= 0);
    return bytes32_t{};
}

void EvmcHost::emit_log(
    Address const &, uint8_t const *, size_t, bytes32_t const[],
    size_t) noexcept
{
}

evmc_access_status EvmcHost::access_account(Address const &address) noexcept
{
    return state_.access_account(address);
}

evmc_access_status EvmcHost::access_storage(
    Address const &address, bytes32_t const &key) noexcept
{
    return state_.access_storage(address, key);
}

bytes32_t EvmcHost::get_transient_storage(
    Address const &address, bytes32_t const &key) const noexcept
{
    return state_.get_transient_storage(address, key);
}

void EvmcHost::set_transient_storage(
    Address const &address, bytes32_t const &key,
    bytes32_t const &value) noexcept
{
    state_.set_transient_storage(address, key, value);
}

SPONGEDIFF_NAMESPACE_END
