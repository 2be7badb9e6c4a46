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

#include <cstdint>
#include <string_view>

TANDEM_NAMESPACE_BEGIN

// Intent hashes are recomputed by the confirming side from the call
// arguments, so that a message can only be confirmed for the exact transfer
// that was declared.

// keccak256(abi.encode(STAKE_INTENT_TYPEHASH, amount, beneficiary, gateway))
bytes32_t hash_stake_intent(
    uint256_t const &amount, Address const &beneficiary,
    Address const &gateway);

// keccak256(abi.encode(REDEEM_INTENT_TYPEHASH, amount, beneficiary,
//                      co_gateway))
bytes32_t hash_redeem_intent(
    uint256_t const &amount, Address const &beneficiary,
    Address const &co_gateway);

// Token name and symbol enter the hash as keccak256 of their bytes
bytes32_t hash_gateway_link_intent(
    Address const &gateway, Address const &co_gateway,
    uint256_t const &bounty, std::string_view token_name,
    std::string_view token_symbol, uint8_t decimals, uint256_t const &nonce,
    Address const &value_token);

TANDEM_NAMESPACE_END
