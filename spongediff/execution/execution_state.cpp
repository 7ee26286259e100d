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
#include <spongediff/core/byte_string.hpp>
#include <spongediff/core/bytes.hpp>
#include <spongediff/core/config.hpp>
#include <spongediff/core/int.hpp>
#include <spongediff/core/keccak.hpp>
#include <spongediff/core/likely.h>
#include <spongediff/execution/execution_state.hpp>

#include <evmc/evmc.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <utility>

SPONGEDIFF_NAMESPACE_BEGIN

ExecutionState::AccountState *ExecutionState::find(Address const &address)
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return &it->second;
}

ExecutionState::AccountState const *
ExecutionState::find(Address const &address) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return &it->second;
}

ExecutionState::AccountState &
ExecutionState::get_or_create(Address const &address)
{
    return accounts_[address];
}

bytes32_t ExecutionState::deploy(Address const &address, byte_string_view code)
{
    auto const code_hash = keccak256(code);
    code_.try_emplace(code_hash, std::make_shared<byte_string const>(code));

    auto &state = get_or_create(address);
    state.account.code_hash = code_hash;
    return code_hash;
}

bool ExecutionState::account_exists(Address const &address) const
{
    return find(address) != nullptr;
}

uint256_t ExecutionState::get_balance(Address const &address) const
{
    if (auto const *const state = find(address); state) {
        return state->account.balance;
    }
    return 0;
}

void ExecutionState::add_to_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account = get_or_create(address).account;
    SPONGEDIFF_ASSERT(
        std::numeric_limits<uint256_t>::max() - delta >= account.balance);
    account.balance += delta;
}

void ExecutionState::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account = get_or_create(address).account;
    SPONGEDIFF_ASSERT(delta <= account.balance);
    account.balance -= delta;
}

uint64_t ExecutionState::get_nonce(Address const &address) const
{
    if (auto const *const state = find(address); state) {
        return state->account.nonce;
    }
    return 0;
}

void ExecutionState::set_nonce(Address const &address, uint64_t const nonce)
{
    get_or_create(address).account.nonce = nonce;
}

bytes32_t ExecutionState::get_code_hash(Address const &address) const
{
    if (auto const *const state = find(address); state) {
        return state->account.code_hash;
    }
    return bytes32_t{};
}

byte_string_view ExecutionState::get_code(Address const &address) const
{
    auto const *const state = find(address);
    if (state == nullptr || state->account.code_hash == NULL_HASH) {
        return {};
    }
    auto const it = code_.find(state->account.code_hash);
    SPONGEDIFF_ASSERT(it != code_.end());
    return *it->second;
}

size_t ExecutionState::get_code_size(Address const &address) const
{
    return get_code(address).size();
}

size_t ExecutionState::copy_code(
    Address const &address, size_t const offset, uint8_t *const data,
    size_t const size) const
{
    auto const code = get_code(address);
    if (offset >= code.size()) {
        return 0;
    }
    auto const n = std::min(size, code.size() - offset);
    std::memcpy(data, code.data() + offset, n);
    return n;
}

bytes32_t
ExecutionState::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const *const state = find(address);
    if (state == nullptr) {
        return bytes32_t{};
    }
    auto const it = state->storage.find(key);
    if (it == state->storage.end()) {
        return bytes32_t{};
    }
    return it->second.current;
}

evmc_storage_status ExecutionState::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &slot = get_or_create(address).storage[key];
    auto const &original = slot.original;
    auto const &current = slot.current;

    auto const status = [&] {
        if (value == bytes32_t{}) {
            if (current == bytes32_t{}) {
                return EVMC_STORAGE_ASSIGNED;
            }
            else if (original == current) {
                return EVMC_STORAGE_DELETED;
            }
            else if (original == bytes32_t{}) {
                return EVMC_STORAGE_ADDED_DELETED;
            }
            return EVMC_STORAGE_MODIFIED_DELETED;
        }
        if (current == bytes32_t{}) {
            if (original == bytes32_t{}) {
                return EVMC_STORAGE_ADDED;
            }
            else if (value == original) {
                return EVMC_STORAGE_DELETED_RESTORED;
            }
            return EVMC_STORAGE_DELETED_ADDED;
        }
        else if (original == current && original != value) {
            return EVMC_STORAGE_MODIFIED;
        }
        else if (original == value && original != current) {
            return EVMC_STORAGE_MODIFIED_RESTORED;
        }
        return EVMC_STORAGE_ASSIGNED;
    }();

    slot.current = value;
    return status;
}

bytes32_t ExecutionState::get_transient_storage(
    Address const &address, bytes32_t const &key) const
{
    auto const *const state = find(address);
    if (state == nullptr) {
        return bytes32_t{};
    }
    auto const it = state->transient_storage.find(key);
    if (it == state->transient_storage.end()) {
        return bytes32_t{};
    }
    return it->second;
}

void ExecutionState::set_transient_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    get_or_create(address).transient_storage[key] = value;
}

evmc_access_status ExecutionState::access_account(Address const &address)
{
    auto const [_, inserted] = accessed_accounts_.insert(address);
    if (inserted) {
        return EVMC_ACCESS_COLD;
    }
    return EVMC_ACCESS_WARM;
}

evmc_access_status
ExecutionState::access_storage(Address const &address, bytes32_t const &key)
{
    auto const [_, inserted] =
        get_or_create(address).accessed_storage.insert(key);
    if (inserted) {
        return EVMC_ACCESS_COLD;
    }
    return EVMC_ACCESS_WARM;
}

void ExecutionState::begin_transaction()
{
    accessed_accounts_.clear();
    for (auto &entry : accounts_) {
        auto &state = entry.second;
        state.transient_storage.clear();
        state.accessed_storage.clear();
        for (auto &slot : state.storage) {
            slot.second.original = slot.second.current;
        }
    }
}

ExecutionState::Checkpoint ExecutionState::checkpoint() const
{
    return Checkpoint{
        .accounts = accounts_, .accessed_accounts = accessed_accounts_};
}

void ExecutionState::revert(Checkpoint &&checkpoint)
{
    accounts_ = std::move(checkpoint.accounts);
    accessed_accounts_ = std::move(checkpoint.accessed_accounts);
}

SPONGEDIFF_NAMESPACE_END
