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
#include <tandem/bus/message_registry.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/result.hpp>
#include <tandem/gateway/gateway_config.hpp>
#include <tandem/gateway/records.hpp>
#include <tandem/state/big_endian.hpp>
#include <tandem/state/storage_variable.hpp>

#include <bit>
#include <cstdint>

TANDEM_NAMESPACE_BEGIN

class State;
class StateRootProvider;

// Behaviour shared by both ends of a link: the message box, proving the
// storage of the counterpart gateway, the gateway link handshake and the
// base value flows of bounties and penalties.
class GatewayBase
{
protected:
    State &state_;
    Address const ca_;
    GatewayConfig const config_;
    StateRootProvider const &state_root_provider_;

    class Variables
    {
        State &state_;
        Address const &ca_;

        static constexpr auto AddressLinked{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressActivated{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};

        // Prefixes for mappings
        enum : uint8_t
        {
            PrefixStorageRoot = 0x03,
        };

    public:
        // Prefixes of the message registries, the outbox and inbox status maps
        // live at MESSAGE_BOX_OFFSET
        enum : uint8_t
        {
            PrefixOutboxRecord = 0x10,
            PrefixOutboxActiveProcess = 0x11,
            PrefixInboxRecord = 0x12,
            PrefixInboxActiveProcess = 0x13,
            PrefixLinkRecord = 0x14,
            PrefixLinkActiveProcess = 0x15,
        };

        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        StorageVariable<bool> linked{state_, ca_, AddressLinked};
        StorageVariable<bool> activated{state_, ca_, AddressActivated};

        // mapping(uint64 => bytes32) storage_roots
        auto storage_root(uint64_t const block_height) noexcept
        {
            struct
            {
                uint8_t mask;
                u64_be block_height;
                uint8_t slots[23];
            } key{
                .mask = PrefixStorageRoot,
                .block_height = block_height,
                .slots = {}};

            return StorageVariable<bytes32_t>(
                state_, ca_, std::bit_cast<bytes32_t>(key));
        }
    } vars;

    MessageBox box_;
    MessageRegistry<GatewayLink> links_;

    GatewayBase(
        State &, Address const &ca, GatewayConfig const &,
        StateRootProvider const &, BoxSide link_side);

    ~GatewayBase() = default;

    /////////////
    // Events //
    /////////////

    // event GatewayProven(
    //     address indexed _gateway,
    //     uint256         _blockHeight,
    //     bytes32         _storageRoot,
    //     bool            _wasAlreadyProved);
    void emit_gateway_proven_event(
        uint64_t block_height, bytes32_t const &storage_root,
        bool was_already_proved);

    // event GatewayLinkProgressed(
    //     bytes32 indexed _messageHash,
    //     address indexed _gateway,
    //     address indexed _cogateway,
    //     address         _token,
    //     bool            _proofProgress,
    //     bytes32         _unlockSecret);
    void emit_gateway_link_progressed_event(
        bytes32_t const &message_hash, bytes32_t const &unlock_secret);

    /////////////
    // Helpers //
    /////////////
    virtual Address const &gateway_address() const noexcept = 0;
    virtual Address const &co_gateway_address() const noexcept = 0;

    bytes32_t hash_link_intent(uint256_t const &nonce) const;

    Result<bytes32_t> proven_storage_root(uint64_t block_height);

    Result<void> receive_value(Address const &from, uint256_t const &amount);
    void send_value(Address const &to, uint256_t const &amount);

    uint256_t penalty() const;

    // Reward of the facilitator completing `message`:
    //     min(gas_consumed + gas used since `initial_gas`, gas_limit)
    //         * gas_price
    Result<uint256_t> fee_of(
        Message const &, uint64_t initial_gas, uint256_t const &amount) const;

    // Proof bytes are metered as calldata
    void charge_calldata(byte_string_view);

    Result<void> require_linked();

public:
    GatewayBase(GatewayBase const &) = delete;
    GatewayBase &operator=(GatewayBase const &) = delete;

    Address const &address() const noexcept
    {
        return ca_;
    }

    GatewayConfig const &config() const noexcept
    {
        return config_;
    }

    // Name of the end of the link, for logging
    char const *role() const noexcept
    {
        return links_.side() == BoxSide::Outbox ? "Gateway" : "CoGateway";
    }

    // Proves the account of the counterpart gateway against the anchored
    // state root at `block_height` and keeps its storage root. Proving a
    // height again must yield the same storage root.
    Result<bytes32_t> prove_gateway(
        uint64_t block_height, byte_string_view encoded_account,
        byte_string_view proof);

    Result<void> progress_gateway_link(
        Address const &msg_sender, bytes32_t const &message_hash,
        bytes32_t const &unlock_secret);

    // Nonce of the next outgoing message of `account`
    virtual uint256_t get_nonce(Address const &account) = 0;

    MessageStatus get_outbox_status(bytes32_t const &message_hash);
    MessageStatus get_inbox_status(bytes32_t const &message_hash);

    // Zero if no storage root was proven at the height
    bytes32_t get_storage_root(uint64_t block_height);

    bool is_linked();
};

TANDEM_NAMESPACE_END
