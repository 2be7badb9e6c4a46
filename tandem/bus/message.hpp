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
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/state/big_endian.hpp>

#include <cstdint>

TANDEM_NAMESPACE_BEGIN

enum class MessageStatus : uint8_t
{
    Undeclared = 0,
    Declared,
    Progressed,
    DeclaredRevocation,
    Revoked,
};

inline bool is_terminal(MessageStatus const status)
{
    return status == MessageStatus::Progressed ||
           status == MessageStatus::Revoked;
}

// Storage word of a status, as read by a storage proof of the counterpart
bytes32_t to_status_word(MessageStatus);

struct Message
{
    bytes32_t intent_hash;
    u256_be nonce;
    u256_be gas_price;
    u256_be gas_limit;
    Address sender;
    bytes32_t hash_lock;
    // Gas spent confirming the message, charged as part of the fee on
    // completion. Not part of the message hash.
    u256_be gas_consumed;
};

static_assert(sizeof(Message) == 212);
static_assert(alignof(Message) == 1);

// keccak256("Message(bytes32 intentHash,uint256 nonce,uint256 gasPrice,
//            uint256 gasLimit,address sender,bytes32 hashLock)")
inline constexpr bytes32_t MESSAGE_TYPEHASH{
    0x9cf4230a47925df81c8303f411cf77638da117f88b9797df996fd848e6ad8f64_bytes32};

// keccak256(abi.encode(MESSAGE_TYPEHASH, intent_hash, nonce, gas_price,
//                      gas_limit, sender, hash_lock))
bytes32_t message_hash(Message const &);

bytes32_t to_hash_lock(bytes32_t const &unlock_secret);

TANDEM_NAMESPACE_END
