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

#include <tandem/core/address.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>
#include <tandem/mpt/trie.hpp>
#include <tandem/state/account.hpp>
#include <tandem/state/event_log.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

TANDEM_NAMESPACE_BEGIN

namespace gas
{
    inline constexpr uint64_t SLOAD = 800;
    inline constexpr uint64_t SSTORE_SET = 20000;
    inline constexpr uint64_t SSTORE_RESET = 5000;
    inline constexpr uint64_t LOG = 375;
    inline constexpr uint64_t LOG_TOPIC = 375;
    inline constexpr uint64_t LOG_DATA_BYTE = 8;
    inline constexpr uint64_t CALLDATA_BYTE = 16;
}

// World state of a single chain. Storage accesses and logs are metered so that
// contracts can compute the gas consumed by a call.
//
// Checkpoints nest: every push must be matched by pop_accept, which keeps the
// changes made since, or pop_reject, which discards them. Metered gas is never
// rolled back.
class State
{
    struct AccountState
    {
        uint64_t nonce{0};
        uint256_t balance{0};
        bytes32_t code_hash{NULL_HASH};
        std::map<bytes32_t, bytes32_t> storage{};
    };

    struct Snapshot
    {
        std::map<Address, AccountState> accounts;
        size_t log_count;
    };

    std::map<Address, AccountState> accounts_{};
    std::vector<EventLog> logs_{};
    std::vector<Snapshot> checkpoints_{};
    uint64_t gas_used_{0};
    uint64_t block_number_{0};

    Account to_account(AccountState const &) const;
    mpt::Trie state_trie() const;

public:
    State() = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    bool account_exists(Address const &) const;
    void create_contract(Address const &, bytes32_t const &code_hash);

    uint64_t get_nonce(Address const &) const;
    uint256_t get_balance(Address const &) const;
    void add_to_balance(Address const &, uint256_t const &);
    void subtract_from_balance(Address const &, uint256_t const &);

    bytes32_t get_storage(Address const &, bytes32_t const &key);
    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    void store_log(EventLog const &);

    std::vector<EventLog> const &logs() const noexcept
    {
        return logs_;
    }

    void charge_gas(uint64_t);

    uint64_t gas_used() const noexcept
    {
        return gas_used_;
    }

    uint64_t block_number() const noexcept
    {
        return block_number_;
    }

    // Seals the current block, returns the new block number
    uint64_t commit_block();

    void push();
    void pop_accept();
    void pop_reject();

    bytes32_t storage_root(Address const &) const;
    bytes32_t state_root() const;

    // Rlp encoded account, as found in the state trie
    byte_string encode_account(Address const &) const;

    byte_string prove_account(Address const &) const;
    byte_string prove_storage(Address const &, bytes32_t const &key) const;
};

// Runs the enclosing scope as one unit: unless accept() is called, every
// change made to the state since construction is discarded on destruction.
class StateCheckpoint
{
    State &state_;
    bool settled_{false};

public:
    explicit StateCheckpoint(State &state)
        : state_{state}
    {
        state_.push();
    }

    StateCheckpoint(StateCheckpoint const &) = delete;
    StateCheckpoint &operator=(StateCheckpoint const &) = delete;

    ~StateCheckpoint()
    {
        if (!settled_) {
            state_.pop_reject();
        }
    }

    void accept()
    {
        state_.pop_accept();
        settled_ = true;
    }
};

TANDEM_NAMESPACE_END
