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
#include <spongediff/core/int.hpp>
#include <spongediff/execution/account.hpp>

#include <evmc/evmc.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <memory>

SPONGEDIFF_NAMESPACE_BEGIN

using SharedCode = std::shared_ptr<byte_string const>;

// In-memory world state backing the EVMC host. Storage keeps the value at
// the start of the current transaction next to the current value so that
// set_storage can report the EIP-2200 status.
class ExecutionState
{
public:
    struct StorageSlot
    {
        bytes32_t original{};
        bytes32_t current{};
    };

    using StorageMap = ankerl::unordered_dense::map<
        bytes32_t, StorageSlot, ankerl::unordered_dense::hash<bytes32_t>>;

    using TransientStorageMap = ankerl::unordered_dense::map<
        bytes32_t, bytes32_t, ankerl::unordered_dense::hash<bytes32_t>>;

    struct AccountState
    {
        Account account{};
        StorageMap storage{};
        TransientStorageMap transient_storage{};
        ankerl::unordered_dense::set<
            bytes32_t, ankerl::unordered_dense::hash<bytes32_t>>
            accessed_storage{};
    };

    using AccountMap = ankerl::unordered_dense::map<
        Address, AccountState, ankerl::unordered_dense::hash<Address>>;

    // Everything a reverted call frame has to roll back. Code is immutable
    // and content addressed so it is not part of it.
    struct Checkpoint
    {
        AccountMap accounts;
        ankerl::unordered_dense::set<
            Address, ankerl::unordered_dense::hash<Address>>
            accessed_accounts;
    };

private:
    AccountMap accounts_{};
    ankerl::unordered_dense::set<Address, ankerl::unordered_dense::hash<Address>>
        accessed_accounts_{};
    ankerl::unordered_dense::map<
        bytes32_t, SharedCode, ankerl::unordered_dense::hash<bytes32_t>>
        code_{};

    AccountState *find(Address const &);
    AccountState const *find(Address const &) const;
    AccountState &get_or_create(Address const &);

public:
    ExecutionState() = default;
    ExecutionState(ExecutionState const &) = delete;
    ExecutionState &operator=(ExecutionState const &) = delete;

    bytes32_t deploy(Address const &, byte_string_view code);

    [[nodiscard]] bool account_exists(Address const &) const;

    [[nodiscard]] uint256_t get_balance(Address const &) const;
    void add_to_balance(Address const &, uint256_t const &);
    void subtract_from_balance(Address const &, uint256_t const &);

    [[nodiscard]] uint64_t get_nonce(Address const &) const;
    void set_nonce(Address const &, uint64_t);

    [[nodiscard]] bytes32_t get_code_hash(Address const &) const;
    [[nodiscard]] byte_string_view get_code(Address const &) const;
    [[nodiscard]] size_t get_code_size(Address const &) const;
    size_t copy_code(
        Address const &, size_t offset, uint8_t *data, size_t size) const;

    [[nodiscard]] bytes32_t
    get_storage(Address const &, bytes32_t const &key) const;
    evmc_storage_status set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    [[nodiscard]] bytes32_t
    get_transient_storage(Address const &, bytes32_t const &key) const;
    void set_transient_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    evmc_access_status access_account(Address const &);
    evmc_access_status access_storage(Address const &, bytes32_t const &key);

    // Start of a top level call: clears access status and transient storage
    // and makes the current storage values the original ones.
    void begin_transaction();

    [[nodiscard]] Checkpoint checkpoint() const;
    void revert(Checkpoint &&);
};

SPONGEDIFF_NAMESPACE_END
