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

#include <tandem/bus/message.hpp>
#include <tandem/bus/message_box.hpp>
#include <tandem/bus/message_bus_error.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/core/likely.h>
#include <tandem/core/result.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/big_endian.hpp>
#include <tandem/state/storage_variable.hpp>

#include <boost/outcome/success_failure.hpp>

#include <bit>
#include <concepts>
#include <cstdint>

TANDEM_NAMESPACE_BEGIN

class State;

template <typename T>
concept MessageRecord = requires(T const &record) {
    { record.message } -> std::convertible_to<Message const &>;
};

// Records of one direction of an endpoint, addressed by message hash, and the
// index of the process each account has in flight in that direction. An
// account may start a new process only once its previous message reached a
// terminal status in `side` of the box.
template <MessageRecord Record>
class MessageRegistry
{
    State &state_;
    Address const &ca_;
    MessageBox &box_;
    BoxSide const side_;
    uint8_t const records_prefix_;
    uint8_t const active_prefix_;

public:
    MessageRegistry(
        State &state, Address const &ca, MessageBox &box, BoxSide const side,
        uint8_t const records_prefix, uint8_t const active_prefix)
        : state_{state}
        , ca_{ca}
        , box_{box}
        , side_{side}
        , records_prefix_{records_prefix}
        , active_prefix_{active_prefix}
    {
    }

    // mapping(bytes32 => Record) records
    StorageVariable<Record> record(bytes32_t const &message_hash) const
    {
        auto const encoded = AbiEncoder{}
                                 .add_bytes32(message_hash)
                                 .add_uint(records_prefix_)
                                 .encode_final();
        return StorageVariable<Record>{
            state_, ca_, to_bytes(keccak256(encoded))};
    }

    // mapping(address => bytes32) active_process
    StorageVariable<bytes32_t> active_process(Address const &account) const
    {
        struct
        {
            uint8_t mask;
            Address address;
            uint8_t slots[11];
        } key{.mask = active_prefix_, .address = account, .slots = {}};

        return StorageVariable<bytes32_t>{
            state_, ca_, std::bit_cast<bytes32_t>(key)};
    }

    BoxSide side() const noexcept
    {
        return side_;
    }

    uint256_t get_nonce(Address const &account) const
    {
        auto const active = active_process(account).load();
        if (active == bytes32_t{}) {
            return 0;
        }
        return record(active).load().message.nonce.native() + 1;
    }

    // Stores `new_record` under `message_hash` and makes it the active
    // process of `account`. The record of the superseded message is deleted
    // last.
    Result<void> initiate_new_process(
        Address const &account, uint256_t const &nonce,
        bytes32_t const &message_hash, Record const &new_record)
    {
        if (TANDEM_UNLIKELY(nonce != get_nonce(account))) {
            return MessageBusError::InvalidNonce;
        }

        auto active = active_process(account);
        auto const previous = active.load();
        if (previous != bytes32_t{} &&
            TANDEM_UNLIKELY(!is_terminal(box_.status(side_, previous)))) {
            return MessageBusError::PreviousProcessNotCompleted;
        }

        record(message_hash).store(new_record);
        active.store(message_hash);
        if (previous != bytes32_t{}) {
            record(previous).clear();
        }
        return outcome::success();
    }
};

TANDEM_NAMESPACE_END
