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
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/core/result.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/big_endian.hpp>
#include <tandem/state/storage_variable.hpp>
#include <tandem/token/token.hpp>

#include <bit>
#include <cstdint>

TANDEM_NAMESPACE_BEGIN

class State;

class EIP20Token final : public UtilityToken
{
    State &state_;
    Address const ca_;
    Address const minter_;

    class Variables
    {
        State &state_;
        Address const &ca_;

        static constexpr auto AddressTotalSupply{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        enum : uint8_t
        {
            PrefixBalance = 0x02,
            PrefixAllowance = 0x03,
        };

    public:
        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        StorageVariable<u256_be> total_supply{state_, ca_, AddressTotalSupply};

        // mapping(address => uint256) balances
        auto balance(Address const &owner) noexcept
        {
            struct
            {
                uint8_t mask;
                Address address;
                uint8_t slots[11];
            } key{.mask = PrefixBalance, .address = owner, .slots = {}};

            return StorageVariable<u256_be>(
                state_, ca_, std::bit_cast<bytes32_t>(key));
        }

        // mapping(address => mapping(address => uint256)) allowances
        auto allowance(Address const &owner, Address const &spender)
        {
            auto const encoded = AbiEncoder{}
                                     .add_address(owner)
                                     .add_address(spender)
                                     .add_uint(PrefixAllowance)
                                     .encode_final();
            return StorageVariable<u256_be>(
                state_, ca_, to_bytes(keccak256(encoded)));
        }
    } vars;

    // event Transfer(
    //     address indexed _from,
    //     address indexed _to,
    //     uint256         _value);
    void emit_transfer_event(
        Address const &from, Address const &to, uint256_t const &value);

    // event Approval(
    //     address indexed _owner,
    //     address indexed _spender,
    //     uint256         _value);
    void emit_approval_event(
        Address const &owner, Address const &spender, uint256_t const &value);

public:
    EIP20Token(State &, Address const &ca, Address const &minter);
    EIP20Token(EIP20Token const &) = delete;
    EIP20Token &operator=(EIP20Token const &) = delete;

    Address const &address() const noexcept
    {
        return ca_;
    }

    uint256_t balance_of(Address const &) override;
    uint256_t total_supply() override;

    uint256_t
    allowance(Address const &owner, Address const &spender) override;

    Result<void> approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount) override;

    Result<void> transfer(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount) override;

    Result<void> mint(
        Address const &caller, Address const &beneficiary,
        uint256_t const &amount) override;

    Result<void> burn(
        Address const &caller, Address const &holder,
        uint256_t const &amount) override;
};

TANDEM_NAMESPACE_END
