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

#include <tandem/bus/message.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/state/abi_encode.hpp>

#include <intx/intx.hpp>

#include <utility>

TANDEM_NAMESPACE_BEGIN

bytes32_t to_status_word(MessageStatus const status)
{
    return intx::be::store<bytes32_t>(
        uint256_t{std::to_underlying(status)});
}

bytes32_t message_hash(Message const &message)
{
    auto const encoded = AbiEncoder{}
                             .add_bytes32(MESSAGE_TYPEHASH)
                             .add_bytes32(message.intent_hash)
                             .add_int(message.nonce)
                             .add_int(message.gas_price)
                             .add_int(message.gas_limit)
                             .add_address(message.sender)
                             .add_bytes32(message.hash_lock)
                             .encode_final();
    return to_bytes(keccak256(encoded));
}

bytes32_t to_hash_lock(bytes32_t const &unlock_secret)
{
    return to_bytes(keccak256(to_byte_string_view(unlock_secret)));
}

TANDEM_NAMESPACE_END
