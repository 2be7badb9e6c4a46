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
#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>

#include <cstdint>

TANDEM_NAMESPACE_BEGIN

class State;

enum class BoxSide : uint8_t
{
    Outbox,
    Inbox,
};

// Storage slot of the message box in every endpoint contract. The outbox
// mapping lives at this slot and the inbox mapping at the next one, so that
// either side can locate a status of its counterpart in a storage proof.
inline constexpr uint64_t MESSAGE_BOX_OFFSET = 7;

// Outbox and inbox status maps of one endpoint, kept in the storage of the
// endpoint contract. Unseen hashes read as Undeclared.
class MessageBox
{
    State &state_;
    Address const &ca_;

public:
    MessageBox(State &, Address const &);

    // keccak256(abi.encode(message_hash, MESSAGE_BOX_OFFSET + side))
    static bytes32_t slot(BoxSide, bytes32_t const &message_hash);

    MessageStatus status(BoxSide, bytes32_t const &message_hash);
    void set_status(BoxSide, bytes32_t const &message_hash, MessageStatus);

    MessageStatus outbox(bytes32_t const &message_hash)
    {
        return status(BoxSide::Outbox, message_hash);
    }

    MessageStatus inbox(bytes32_t const &message_hash)
    {
        return status(BoxSide::Inbox, message_hash);
    }

    State &state() noexcept
    {
        return state_;
    }

    Address const &address() const noexcept
    {
        return ca_;
    }
};

TANDEM_NAMESPACE_END
