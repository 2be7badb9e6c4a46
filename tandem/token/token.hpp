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
#include <tandem/core/result.hpp>

TANDEM_NAMESPACE_BEGIN

// Balances of an EIP20 token living on the same chain as its caller
class Token
{
public:
    virtual ~Token() = default;

    virtual uint256_t balance_of(Address const &) = 0;
    virtual uint256_t total_supply() = 0;
    virtual uint256_t
    allowance(Address const &owner, Address const &spender) = 0;

    virtual Result<void> approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount) = 0;

    // Moves `amount` from `from` to `to`. A `caller` other than `from` spends
    // the allowance `from` granted it.
    virtual Result<void> transfer(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount) = 0;
};

// Token whose supply is controlled by a single minter, the CoGateway of the
// auxiliary chain
class UtilityToken : public Token
{
public:
    virtual Result<void> mint(
        Address const &caller, Address const &beneficiary,
        uint256_t const &amount) = 0;

    virtual Result<void> burn(
        Address const &caller, Address const &holder,
        uint256_t const &amount) = 0;
};

TANDEM_NAMESPACE_END
