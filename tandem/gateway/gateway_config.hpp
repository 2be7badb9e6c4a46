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
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>

#include <cstdint>
#include <string>

TANDEM_NAMESPACE_BEGIN

// Deployment parameters of a gateway. Both ends of a link must agree on the
// bounty, the value token and its metadata, they are part of the link intent.
struct GatewayConfig
{
    // Token staked on origin
    Address value_token{};
    // Base value paid by stakers and redeemers to facilitators
    uint256_t bounty{0};
    Address organization{};
    // Receives the bounty and penalty of revoked messages
    Address burner{};
    // Gateway of the other chain, whose storage is proven
    Address counterpart{};
    // Origin only, holds staked value until it is unstaked. It approves the
    // gateway to release value on unstake.
    Address stake_vault{};
    std::string token_name{};
    std::string token_symbol{};
    uint8_t decimals{18};
};

TANDEM_NAMESPACE_END
