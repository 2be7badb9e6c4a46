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
#include <tandem/bus/message_box.hpp>
#include <tandem/core/assert.h>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/big_endian.hpp>
#include <tandem/state/state.hpp>
#include <tandem/state/storage_variable.hpp>

#include <intx/intx.hpp>

#include <utility>

TANDEM_NAMESPACE_BEGIN

MessageBox::MessageBox(State &state, Address const &ca)
    : state_{state}
    , ca_{ca}
{
}

bytes32_t MessageBox::slot(BoxSide const side, bytes32_t const &message_hash)
{
    uint64_t const offset = MESSAGE_BOX_OFFSET + std::to_underlying(side);
    auto const encoded = AbiEncoder{}
                             .add_bytes32(message_hash)
                             .add_int(u256_be{offset})
                             .encode_final();
    return to_bytes(keccak256(encoded));
}

MessageStatus
MessageBox::status(BoxSide const side, bytes32_t const &message_hash)
{
    StorageVariable<u256_be> const var{state_, ca_, slot(side, message_hash)};
    auto const value = var.load().native();
    TANDEM_ASSERT(value <= std::to_underlying(MessageStatus::Revoked));
    return static_cast<MessageStatus>(static_cast<uint8_t>(value));
}

void MessageBox::set_status(
    BoxSide const side, bytes32_t const &message_hash,
    MessageStatus const status)
{
    StorageVariable<u256_be> var{state_, ca_, slot(side, message_hash)};
    var.store(u256_be{uint256_t{std::to_underlying(status)}});
}

TANDEM_NAMESPACE_END
