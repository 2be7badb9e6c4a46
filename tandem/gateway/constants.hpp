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

#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>

#include <cstdint>

TANDEM_NAMESPACE_BEGIN

// keccak256("StakeIntent(uint256 amount,address beneficiary,address gateway)")
inline constexpr bytes32_t STAKE_INTENT_TYPEHASH{
    0xfb6e1349876ffeefa5eb4210fb5aad8aaf18d1912c7612c50fb377ff474f1bf2_bytes32};

// keccak256("RedeemIntent(uint256 amount,address beneficiary,address gateway)")
inline constexpr bytes32_t REDEEM_INTENT_TYPEHASH{
    0x18d167ae2116ce4babd618741d529574e0d0755f9116d4d7897f65b28e29cef1_bytes32};

// keccak256("GatewayLink(bytes32 messageHash,Message message)")
inline constexpr bytes32_t GATEWAY_LINK_TYPEHASH{
    0x6c0503548c9bdaf3525226fec6397d89b6198742ab32d2b5335de3ef2dfbb922_bytes32};

// Penalty paid on revocation, in percent of the bounty
inline constexpr uint64_t REVOCATION_PENALTY = 150;

TANDEM_NAMESPACE_END
