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

#include <tandem/core/address.hpp>
#include <tandem/core/assert.h>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/mpt/trie.hpp>
#include <tandem/rlp/encode.hpp>
#include <tandem/state/account.hpp>
#include <tandem/state/account_rlp.hpp>
#include <tandem/state/event_log.hpp>
#include <tandem/state/state.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <limits>
#include <utility>

TANDEM_ANONYMOUS_NAMESPACE_BEGIN

byte_string hashed_key(byte_string_view const key)
{
    return byte_string{to_byte_string_view(to_bytes(keccak256(key)))};
}

// Slots are stored as the rlp of their value without leading zeros
byte_string encode_storage_value(bytes32_t const &value)
{
    return rlp::encode_unsigned(intx::be::load<uint256_t>(value));
}

mpt::Trie storage_trie(std::map<bytes32_t, bytes32_t> const &storage)
{
    mpt::Trie trie;
    for (auto const &[key, value] : storage) {
        trie.upsert(
            hashed_key(to_byte_string_view(key)), encode_storage_value(value));
    }
    return trie;
}

TANDEM_ANONYMOUS_NAMESPACE_END

TANDEM_NAMESPACE_BEGIN

Account State::to_account(AccountState const &state) const
{
    return Account{
        .nonce = state.nonce,
        .balance = state.balance,
        .storage_root = storage_trie(state.storage).root_hash(),
        .code_hash = state.code_hash};
}

bool State::account_exists(Address const &address) const
{
    return accounts_.contains(address);
}

void State::create_contract(Address const &address, bytes32_t const &code_hash)
{
    auto &account = accounts_[address];
    account.nonce = 1;
    account.code_hash = code_hash;
}

uint64_t State::get_nonce(Address const &address) const
{
    auto const it = accounts_.find(address);
    return it == accounts_.end() ? 0 : it->second.nonce;
}

uint256_t State::get_balance(Address const &address) const
{
    auto const it = accounts_.find(address);
    return it == accounts_.end() ? uint256_t{0} : it->second.balance;
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &balance = accounts_[address].balance;
    TANDEM_ASSERT(std::numeric_limits<uint256_t>::max() - delta >= balance);
    balance += delta;
}

void State::subtract_from_balance(Address const &address, uint256_t const &delta)
{
    auto &balance = accounts_[address].balance;
    TANDEM_ASSERT(balance >= delta);
    balance -= delta;
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key)
{
    charge_gas(gas::SLOAD);
    auto const account = accounts_.find(address);
    if (account == accounts_.end()) {
        return {};
    }
    auto const slot = account->second.storage.find(key);
    return slot == account->second.storage.end() ? bytes32_t{} : slot->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &storage = accounts_[address].storage;
    auto const it = storage.find(key);
    bool const was_zero = it == storage.end();
    charge_gas(
        was_zero && value != bytes32_t{} ? gas::SSTORE_SET
                                         : gas::SSTORE_RESET);
    if (value == bytes32_t{}) {
        if (!was_zero) {
            storage.erase(it);
        }
    }
    else {
        storage.insert_or_assign(key, value);
    }
}

void State::store_log(EventLog const &log)
{
    charge_gas(
        gas::LOG + gas::LOG_TOPIC * log.topics.size() +
        gas::LOG_DATA_BYTE * log.data.size());
    logs_.push_back(log);
}

void State::charge_gas(uint64_t const gas)
{
    gas_used_ += gas;
}

uint64_t State::commit_block()
{
    TANDEM_ASSERT(checkpoints_.empty());
    return ++block_number_;
}

void State::push()
{
    checkpoints_.push_back(
        Snapshot{.accounts = accounts_, .log_count = logs_.size()});
}

void State::pop_accept()
{
    TANDEM_ASSERT(!checkpoints_.empty());
    checkpoints_.pop_back();
}

void State::pop_reject()
{
    TANDEM_ASSERT(!checkpoints_.empty());
    auto &snapshot = checkpoints_.back();
    accounts_ = std::move(snapshot.accounts);
    logs_.resize(snapshot.log_count);
    checkpoints_.pop_back();
}

bytes32_t State::storage_root(Address const &address) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return mpt::EMPTY_TRIE_ROOT;
    }
    return storage_trie(it->second.storage).root_hash();
}

mpt::Trie State::state_trie() const
{
    mpt::Trie trie;
    for (auto const &[address, account] : accounts_) {
        trie.upsert(
            hashed_key(to_byte_string_view(address)),
            rlp::encode_account(to_account(account)));
    }
    return trie;
}

bytes32_t State::state_root() const
{
    return state_trie().root_hash();
}

byte_string State::encode_account(Address const &address) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return rlp::encode_account(Account{});
    }
    return rlp::encode_account(to_account(it->second));
}

byte_string State::prove_account(Address const &address) const
{
    return state_trie().prove(hashed_key(to_byte_string_view(address)));
}

byte_string
State::prove_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = accounts_.find(address);
    mpt::Trie const trie = it == accounts_.end()
                               ? mpt::Trie{}
                               : storage_trie(it->second.storage);
    return trie.prove(hashed_key(to_byte_string_view(key)));
}

TANDEM_NAMESPACE_END
