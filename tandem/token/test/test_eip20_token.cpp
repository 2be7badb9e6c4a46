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

#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/state.hpp>
#include <tandem/token/eip20_token.hpp>
#include <tandem/token/token_error.hpp>

#include <gtest/gtest.h>

using namespace tandem;

namespace
{
    constexpr auto TOKEN_ADDRESS =
        0x0000000000000000000000000000000000000070_address;
    constexpr auto CO_GATEWAY = 0x00000000000000000000000000000000000c0c0a_address;
    constexpr auto HOLDER = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto OTHER = 0x0000000000000000000000000000000000000b0b_address;
}

struct EIP20TokenTest : public ::testing::Test
{
    State state;
    EIP20Token token{state, TOKEN_ADDRESS, CO_GATEWAY};

    void SetUp() override
    {
        ASSERT_TRUE(token.mint(CO_GATEWAY, HOLDER, 1000).has_value());
        ASSERT_TRUE(token.mint(CO_GATEWAY, CO_GATEWAY, 1000).has_value());
    }
};

TEST_F(EIP20TokenTest, mint)
{
    EXPECT_EQ(token.balance_of(HOLDER), 1000);
    EXPECT_EQ(token.total_supply(), 2000);

    auto const &log = state.logs().back();
    EXPECT_EQ(log.address, TOKEN_ADDRESS);
    ASSERT_EQ(log.topics.size(), 3u);
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash("Transfer(address,address,uint256)"));
    EXPECT_EQ(log.topics[1], bytes32_t{});
    EXPECT_EQ(log.topics[2], abi_encode_address(CO_GATEWAY));
}

TEST_F(EIP20TokenTest, mint_only_minter)
{
    auto const res = token.mint(OTHER, OTHER, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::Unauthorized);
    EXPECT_EQ(token.balance_of(OTHER), 0);
}

TEST_F(EIP20TokenTest, burn_zero_amount)
{
    auto const res = token.burn(CO_GATEWAY, CO_GATEWAY, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::ZeroAmount);
}

TEST_F(EIP20TokenTest, burn_only_minter)
{
    auto const res = token.burn(OTHER, CO_GATEWAY, 500);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::Unauthorized);
}

TEST_F(EIP20TokenTest, burn_insufficient_balance)
{
    auto const res = token.burn(CO_GATEWAY, CO_GATEWAY, 2000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
    EXPECT_EQ(token.total_supply(), 2000);
}

TEST_F(EIP20TokenTest, burn)
{
    ASSERT_TRUE(token.burn(CO_GATEWAY, CO_GATEWAY, 500).has_value());
    EXPECT_EQ(token.balance_of(CO_GATEWAY), 500);
    EXPECT_EQ(token.total_supply(), 1500);

    auto const &log = state.logs().back();
    ASSERT_EQ(log.topics.size(), 3u);
    EXPECT_EQ(log.topics[1], abi_encode_address(CO_GATEWAY));
    EXPECT_EQ(log.topics[2], bytes32_t{});
    EXPECT_EQ(
        log.data,
        byte_string{to_byte_string_view(abi_encode_int(u256_be{500}))});
}

TEST_F(EIP20TokenTest, transfer)
{
    ASSERT_TRUE(token.transfer(HOLDER, HOLDER, OTHER, 400).has_value());
    EXPECT_EQ(token.balance_of(HOLDER), 600);
    EXPECT_EQ(token.balance_of(OTHER), 400);
    EXPECT_EQ(token.total_supply(), 2000);

    auto const res = token.transfer(OTHER, OTHER, HOLDER, 401);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
    EXPECT_EQ(token.balance_of(OTHER), 400);
}

TEST_F(EIP20TokenTest, transfer_to_self)
{
    ASSERT_TRUE(token.transfer(HOLDER, HOLDER, HOLDER, 1000).has_value());
    EXPECT_EQ(token.balance_of(HOLDER), 1000);
}

TEST_F(EIP20TokenTest, transfer_without_allowance)
{
    auto const res = token.transfer(OTHER, HOLDER, OTHER, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientAllowance);
    EXPECT_EQ(token.balance_of(HOLDER), 1000);
    EXPECT_EQ(token.balance_of(OTHER), 0);
}

TEST_F(EIP20TokenTest, transfer_spends_allowance)
{
    ASSERT_TRUE(token.approve(HOLDER, OTHER, 300).has_value());
    EXPECT_EQ(token.allowance(HOLDER, OTHER), 300);
    EXPECT_EQ(token.allowance(OTHER, HOLDER), 0);

    auto const &log = state.logs().back();
    ASSERT_EQ(log.topics.size(), 3u);
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash("Approval(address,address,uint256)"));
    EXPECT_EQ(log.topics[1], abi_encode_address(HOLDER));
    EXPECT_EQ(log.topics[2], abi_encode_address(OTHER));

    ASSERT_TRUE(token.transfer(OTHER, HOLDER, CO_GATEWAY, 200).has_value());
    EXPECT_EQ(token.allowance(HOLDER, OTHER), 100);
    EXPECT_EQ(token.balance_of(HOLDER), 800);
    EXPECT_EQ(token.balance_of(CO_GATEWAY), 1200);

    auto const res = token.transfer(OTHER, HOLDER, OTHER, 101);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientAllowance);
    EXPECT_EQ(token.allowance(HOLDER, OTHER), 100);
}
