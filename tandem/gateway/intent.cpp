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

#include <tandem/core/keccak.hpp>
#include <tandem/gateway/constants.hpp>
#include <tandem/gateway/intent.hpp>
#include <tandem/state/abi_encode.hpp>

TANDEM_NAMESPACE_BEGIN

bytes32_t hash_stake_intent(
    uint256_t const &amount, Address const &beneficiary,
    Address const &gateway)
{
    auto const encoded = AbiEncoder{}
                             .add_bytes32(STAKE_INTENT_TYPEHASH)
                             .add_uint(amount)
                             .add_address(beneficiary)
                             .add_address(gateway)
                             .encode_final();
    return to_bytes(keccak256(encoded));
}

bytes32_t hash_redeem_intent(
    uint256_t const &amount, Address const &beneficiary,
    Address const &co_gateway)
{
    auto const encoded = AbiEncoder{}
                             .add_bytes32(REDEEM_INTENT_TYPEHASH)
                             .add_uint(amount)
                             .add_address(beneficiary)
                             .add_address(co_gateway)
                             .encode_final();
    return to_bytes(keccak256(encoded));
}

bytes32_t hash_gateway_link_intent(
    Address const &gateway, Address const &co_gateway,
    uint256_t const &bounty, std::string_view const token_name,
    std::string_view const token_symbol, uint8_t const decimals,
    uint256_t const &nonce, Address const &value_token)
{
    auto const encoded =
        AbiEncoder{}
            .add_bytes32(GATEWAY_LINK_TYPEHASH)
            .add_address(gateway)
            .add_address(co_gateway)
            .add_uint(bounty)
            .add_bytes32(
                to_bytes(keccak256(to_byte_string_view(token_name))))
            .add_bytes32(
                to_bytes(keccak256(to_byte_string_view(token_symbol))))
            .add_int(decimals)
            .add_uint(nonce)
            .add_address(value_token)
            .encode_final();
    return to_bytes(keccak256(encoded));
}

TANDEM_NAMESPACE_END
