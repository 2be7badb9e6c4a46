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

#include <tandem/core/likely.h>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/events.hpp>
#include <tandem/state/state.hpp>
#include <tandem/token/eip20_token.hpp>
#include <tandem/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>

TANDEM_NAMESPACE_BEGIN

EIP20Token::EIP20Token(State &state, Address const &ca, Address const &minter)
    : state_{state}
    , ca_{ca}
    , minter_{minter}
    , vars{state, ca_}
{
}

void EIP20Token::emit_transfer_event(
    Address const &from, Address const &to, uint256_t const &value)
{
    constexpr bytes32_t signature{
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(abi_encode_address(from))
                           .add_topic(abi_encode_address(to))
                           .add_data(to_byte_string_view(
                               abi_encode_int(u256_be{value})))
                           .build();
    state_.store_log(event);
}

void EIP20Token::emit_approval_event(
    Address const &owner, Address const &spender, uint256_t const &value)
{
    constexpr bytes32_t signature{
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(abi_encode_address(owner))
                           .add_topic(abi_encode_address(spender))
                           .add_data(to_byte_string_view(
                               abi_encode_int(u256_be{value})))
                           .build();
    state_.store_log(event);
}

uint256_t EIP20Token::balance_of(Address const &owner)
{
    return vars.balance(owner).load().native();
}

uint256_t EIP20Token::total_supply()
{
    return vars.total_supply.load().native();
}

uint256_t
EIP20Token::allowance(Address const &owner, Address const &spender)
{
    return vars.allowance(owner, spender).load().native();
}

Result<void> EIP20Token::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    vars.allowance(owner, spender).store(amount);
    emit_approval_event(owner, spender, amount);
    return outcome::success();
}

Result<void> EIP20Token::transfer(
    Address const &caller, Address const &from, Address const &to,
    uint256_t const &amount)
{
    auto from_balance = vars.balance(from);
    uint256_t const available = from_balance.load().native();
    if (TANDEM_UNLIKELY(available < amount)) {
        return TokenError::InsufficientBalance;
    }
    if (caller != from) {
        auto allowed = vars.allowance(from, caller);
        uint256_t const remaining = allowed.load().native();
        if (TANDEM_UNLIKELY(remaining < amount)) {
            return TokenError::InsufficientAllowance;
        }
        allowed.store(remaining - amount);
    }
    from_balance.store(available - amount);

    auto to_balance = vars.balance(to);
    to_balance.store(to_balance.load().native() + amount);

    emit_transfer_event(from, to, amount);
    return outcome::success();
}

Result<void> EIP20Token::mint(
    Address const &caller, Address const &beneficiary, uint256_t const &amount)
{
    if (TANDEM_UNLIKELY(caller != minter_)) {
        return TokenError::Unauthorized;
    }
    if (TANDEM_UNLIKELY(amount == 0)) {
        return TokenError::ZeroAmount;
    }

    auto balance = vars.balance(beneficiary);
    balance.store(balance.load().native() + amount);
    vars.total_supply.store(total_supply() + amount);

    emit_transfer_event(Address{}, beneficiary, amount);
    return outcome::success();
}

Result<void> EIP20Token::burn(
    Address const &caller, Address const &holder, uint256_t const &amount)
{
    if (TANDEM_UNLIKELY(caller != minter_)) {
        return TokenError::Unauthorized;
    }
    if (TANDEM_UNLIKELY(amount == 0)) {
        return TokenError::ZeroAmount;
    }

    auto balance = vars.balance(holder);
    uint256_t const available = balance.load().native();
    if (TANDEM_UNLIKELY(available < amount)) {
        return TokenError::InsufficientBalance;
    }
    balance.store(available - amount);
    vars.total_supply.store(total_supply() - amount);

    emit_transfer_event(holder, Address{}, amount);
    return outcome::success();
}

TANDEM_NAMESPACE_END
