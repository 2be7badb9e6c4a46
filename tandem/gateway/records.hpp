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
#include <tandem/core/int.hpp>
#include <tandem/state/big_endian.hpp>

TANDEM_NAMESPACE_BEGIN

// Outbox record of the origin gateway
struct Stake
{
    u256_be amount;
    Address beneficiary;
    u256_be bounty;
    Message message;
};

static_assert(sizeof(Stake) == 296);
static_assert(alignof(Stake) == 1);

// Inbox record of the origin gateway
struct Unstake
{
    u256_be amount;
    Address beneficiary;
    Message message;
};

static_assert(sizeof(Unstake) == 264);
static_assert(alignof(Unstake) == 1);

// Inbox record of the auxiliary gateway
struct Mint
{
    u256_be amount;
    Address beneficiary;
    Message message;
};

static_assert(sizeof(Mint) == 264);
static_assert(alignof(Mint) == 1);

// Outbox record of the auxiliary gateway. The facilitator paid the bounty.
struct Redeem
{
    u256_be amount;
    Address beneficiary;
    Address facilitator;
    u256_be bounty;
    Message message;
};

static_assert(sizeof(Redeem) == 316);
static_assert(alignof(Redeem) == 1);

struct GatewayLink
{
    bytes32_t message_hash;
    Message message;
};

static_assert(sizeof(GatewayLink) == 244);
static_assert(alignof(GatewayLink) == 1);

// Sender, nonce and amount of a message whose revocation was confirmed
struct RevertedIntent
{
    Address sender;
    uint256_t nonce;
    uint256_t amount;
};

TANDEM_NAMESPACE_END
