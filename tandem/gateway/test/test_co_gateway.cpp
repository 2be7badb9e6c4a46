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

#include "gateway_fixture.hpp"

#include <tandem/bus/message.hpp>
#include <tandem/bus/message_box.hpp>
#include <tandem/bus/message_bus_error.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/gateway/co_gateway.hpp>
#include <tandem/gateway/gateway.hpp>
#include <tandem/gateway/gateway_error.hpp>
#include <tandem/gateway/intent.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/state.hpp>
#include <tandem/token/eip20_token.hpp>
#include <tandem/token/token_error.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace tandem;
using namespace tandem::test;

using CoGatewayTest = GatewayFixture;

////////////////////
// Stake and mint //
////////////////////

TEST_F(CoGatewayTest, confirm_stake_intent)
{
    auto const hash = stake(1000);
    auto const confirmed = confirm_stake(1000);
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed.value(), hash);
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Declared);

    auto const mint = co_gateway.get_mint(hash);
    ASSERT_TRUE(mint.has_value());
    EXPECT_EQ(mint.value().amount.native(), 1000);
    EXPECT_EQ(mint.value().beneficiary, BENEFICIARY);
    EXPECT_EQ(mint.value().message.sender, STAKER);
    EXPECT_GT(mint.value().message.gas_consumed.native(), 0);
    // the recorded gas does not change the message hash
    EXPECT_EQ(message_hash(mint.value().message), hash);

    auto const &log = auxiliary.logs().back();
    EXPECT_EQ(log.address, CO_GATEWAY);
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash("StakeIntentConfirmed(bytes32,address,uint256,"
                           "address,uint256,uint256,bytes32)"));
    EXPECT_EQ(log.topics[1], hash);
}

TEST_F(CoGatewayTest, confirm_stake_intent_twice)
{
    stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());

    auto const res = confirm_stake(1000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::InvalidNonce);
}

TEST_F(CoGatewayTest, confirm_stake_intent_rejects_other_beneficiary)
{
    auto const hash = stake(1000);
    uint64_t const height = relay_origin();

    auto const res = co_gateway.confirm_stake_intent(
        FACILITATOR,
        STAKER,
        0,
        FACILITATOR,
        1000,
        2,
        100,
        to_hash_lock(SECRET),
        height,
        prove_gateway_box(BoxSide::Outbox, hash));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Undeclared);
    EXPECT_EQ(co_gateway.get_nonce(STAKER), 0);
}

TEST_F(CoGatewayTest, confirm_stake_intent_unproven_height)
{
    auto const hash = stake(1000);
    auto const res = co_gateway.confirm_stake_intent(
        FACILITATOR,
        STAKER,
        0,
        BENEFICIARY,
        1000,
        2,
        100,
        to_hash_lock(SECRET),
        origin.block_number() + 1,
        prove_gateway_box(BoxSide::Outbox, hash));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::StorageRootNotFound);
}

TEST_F(CoGatewayTest, confirm_stake_intent_argument_checks)
{
    uint64_t const height = relay_origin();
    auto const proof = prove_gateway_box(BoxSide::Outbox, bytes32_t{1});
    auto const hash_lock = to_hash_lock(SECRET);

    auto res = co_gateway.confirm_stake_intent(
        FACILITATOR, STAKER, 0, BENEFICIARY, 0, 2, 100, hash_lock, height, proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroAmount);

    res = co_gateway.confirm_stake_intent(
        FACILITATOR, Address{}, 0, BENEFICIARY, 10, 2, 100, hash_lock, height, proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroAccount);

    res = co_gateway.confirm_stake_intent(
        FACILITATOR, STAKER, 0, Address{}, 10, 2, 100, hash_lock, height, proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroBeneficiary);

    res = co_gateway.confirm_stake_intent(
        FACILITATOR, STAKER, 0, BENEFICIARY, 10, 2, 100, bytes32_t{}, height, proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroHashLock);
}

TEST_F(CoGatewayTest, progress_mint)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());
    ASSERT_TRUE(
        co_gateway.progress_mint(FACILITATOR, hash, SECRET).has_value());

    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Progressed);

    // the gas limit of 100 is reached, at gas price 2
    EXPECT_EQ(utility_token.balance_of(BENEFICIARY), 800);
    EXPECT_EQ(utility_token.balance_of(FACILITATOR), 200);
    EXPECT_EQ(utility_token.total_supply(), 1000);

    auto const &log = auxiliary.logs().back();
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash("MintProgressed(bytes32,address,address,uint256,"
                           "uint256,uint256,bool,bytes32)"));
    EXPECT_EQ(log.topics[2], abi_encode_address(STAKER));
    EXPECT_EQ(log.topics[3], abi_encode_address(BENEFICIARY));

    auto const again = co_gateway.progress_mint(FACILITATOR, hash, SECRET);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), MessageBusError::InboxNotDeclared);
}

TEST_F(CoGatewayTest, progress_mint_without_fee)
{
    auto const hash = stake(1000, 0, 100);
    ASSERT_TRUE(confirm_stake(1000, 0, 100).has_value());
    ASSERT_TRUE(
        co_gateway.progress_mint(FACILITATOR, hash, SECRET).has_value());

    EXPECT_EQ(utility_token.balance_of(BENEFICIARY), 1000);
    EXPECT_EQ(utility_token.balance_of(FACILITATOR), 0);
}

TEST_F(CoGatewayTest, progress_mint_fee_exceeds_amount)
{
    auto const hash = stake(100);
    ASSERT_TRUE(confirm_stake(100).has_value());

    auto const res = co_gateway.progress_mint(FACILITATOR, hash, SECRET);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::FeeExceedsAmount);
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Declared);
    EXPECT_EQ(utility_token.total_supply(), 0);
}

TEST_F(CoGatewayTest, progress_mint_with_proof)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());
    ASSERT_TRUE(
        gateway.progress_stake(FACILITATOR, hash, SECRET).has_value());

    uint64_t const height = relay_origin();
    ASSERT_TRUE(co_gateway
                    .progress_mint_with_proof(
                        FACILITATOR,
                        hash,
                        prove_gateway_box(BoxSide::Outbox, hash),
                        height,
                        MessageStatus::Progressed)
                    .has_value());
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(utility_token.balance_of(BENEFICIARY), 800);
    EXPECT_EQ(utility_token.balance_of(FACILITATOR), 200);

    auto const &log = auxiliary.logs().back();
    ASSERT_EQ(log.data.size(), 5 * 32u);
    // proof progress, no secret
    EXPECT_EQ(log.data[3 * 32 + 31], 1);
    EXPECT_EQ(log.data.back(), 0);
}

TEST_F(CoGatewayTest, progress_mint_with_wrong_proof)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());

    // still Declared on origin
    uint64_t const height = relay_origin();
    auto const res = co_gateway.progress_mint_with_proof(
        FACILITATOR,
        hash,
        prove_gateway_box(BoxSide::Outbox, hash),
        height,
        MessageStatus::Progressed);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::MerkleProofVerificationFailed);
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Declared);
}

TEST_F(CoGatewayTest, confirm_revert_stake_requires_declared_revocation)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());

    uint64_t const height = relay_origin();
    auto const res = co_gateway.confirm_revert_stake_intent(
        FACILITATOR, hash, height, prove_gateway_box(BoxSide::Outbox, hash));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::MerkleProofVerificationFailed);
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Declared);
}

/////////////////////////
// Redeem and unstake //
/////////////////////////

TEST_F(CoGatewayTest, redeem)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);

    EXPECT_EQ(co_gateway.get_outbox_status(hash), MessageStatus::Declared);
    EXPECT_EQ(co_gateway.get_nonce(BENEFICIARY), 1);
    EXPECT_EQ(utility_token.balance_of(BENEFICIARY), 300);
    EXPECT_EQ(utility_token.balance_of(CO_GATEWAY), 500);
    EXPECT_EQ(auxiliary.get_balance(BENEFICIARY), INITIAL_VALUE - BOUNTY);
    EXPECT_EQ(auxiliary.get_balance(CO_GATEWAY), BOUNTY);

    auto const record = co_gateway.get_redeem(hash);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().amount.native(), 500);
    EXPECT_EQ(record.value().beneficiary, STAKER);
    EXPECT_EQ(record.value().facilitator, BENEFICIARY);
    EXPECT_EQ(record.value().bounty.native(), BOUNTY);
    EXPECT_EQ(
        record.value().message.intent_hash,
        hash_redeem_intent(500, STAKER, CO_GATEWAY));
}

TEST_F(CoGatewayTest, redeem_argument_checks)
{
    stake_and_mint(1000);
    auto const hash_lock = to_hash_lock(SECRET);

    auto res = co_gateway.redeem(
        BENEFICIARY, BOUNTY, 0, STAKER, 1, 50, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroAmount);

    res = co_gateway.redeem(
        BENEFICIARY, BOUNTY, 500, Address{}, 1, 50, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroBeneficiary);

    res = co_gateway.redeem(
        BENEFICIARY, BOUNTY, 500, STAKER, 1, 50, 0, bytes32_t{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroHashLock);

    res = co_gateway.redeem(
        BENEFICIARY, BOUNTY + 1, 500, STAKER, 1, 50, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::InvalidBounty);

    res = co_gateway.redeem(
        BENEFICIARY, BOUNTY, 801, STAKER, 1, 50, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);

    ASSERT_TRUE(
        utility_token.approve(BENEFICIARY, CO_GATEWAY, 499).has_value());
    res = co_gateway.redeem(
        BENEFICIARY, BOUNTY, 500, STAKER, 1, 50, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientAllowance);

    EXPECT_EQ(co_gateway.get_nonce(BENEFICIARY), 0);
    EXPECT_EQ(utility_token.balance_of(BENEFICIARY), 800);
    EXPECT_EQ(auxiliary.get_balance(BENEFICIARY), INITIAL_VALUE);
}

TEST_F(CoGatewayTest, progress_redeem)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());
    ASSERT_TRUE(
        gateway.progress_unstake(FACILITATOR, hash, SECRET).has_value());

    ASSERT_TRUE(
        co_gateway.progress_redeem(FACILITATOR, hash, SECRET).has_value());
    EXPECT_EQ(co_gateway.get_outbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(utility_token.balance_of(CO_GATEWAY), 0);
    EXPECT_EQ(utility_token.total_supply(), 500);
    EXPECT_EQ(auxiliary.get_balance(FACILITATOR), INITIAL_VALUE + BOUNTY);
    EXPECT_EQ(auxiliary.get_balance(CO_GATEWAY), 0);
}

TEST_F(CoGatewayTest, progress_redeem_with_proof)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());
    ASSERT_TRUE(
        gateway.progress_unstake(FACILITATOR, hash, SECRET).has_value());

    uint64_t const height = relay_origin();
    ASSERT_TRUE(co_gateway
                    .progress_redeem_with_proof(
                        FACILITATOR,
                        hash,
                        prove_gateway_box(BoxSide::Inbox, hash),
                        height,
                        MessageStatus::Progressed)
                    .has_value());
    EXPECT_EQ(co_gateway.get_outbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(utility_token.total_supply(), 500);
    EXPECT_EQ(auxiliary.get_balance(FACILITATOR), INITIAL_VALUE + BOUNTY);
}

TEST_F(CoGatewayTest, progress_redeem_after_late_revocation)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());
    ASSERT_TRUE(
        co_gateway.revert_redemption(BENEFICIARY, PENALTY, hash).has_value());
    ASSERT_TRUE(
        gateway.progress_unstake(FACILITATOR, hash, SECRET).has_value());

    uint64_t const height = relay_origin();
    ASSERT_TRUE(co_gateway
                    .progress_redeem_with_proof(
                        FACILITATOR,
                        hash,
                        prove_gateway_box(BoxSide::Inbox, hash),
                        height,
                        MessageStatus::Progressed)
                    .has_value());
    EXPECT_EQ(co_gateway.get_outbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(utility_token.balance_of(CO_GATEWAY), 0);
    EXPECT_EQ(utility_token.total_supply(), 500);
    EXPECT_EQ(auxiliary.get_balance(FACILITATOR), INITIAL_VALUE + BOUNTY);
    EXPECT_EQ(auxiliary.get_balance(BURNER), PENALTY);
    EXPECT_EQ(auxiliary.get_balance(CO_GATEWAY), 0);

    EXPECT_EQ(co_gateway.get_nonce(BENEFICIARY), 1);
    redeem(100, 1, 50, 1);
}

TEST_F(CoGatewayTest, revert_redemption)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());

    auto res = co_gateway.revert_redemption(STAKER, PENALTY, hash);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::OnlyRedeemer);

    res = co_gateway.revert_redemption(BENEFICIARY, 0, hash);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::InvalidPenalty);

    ASSERT_TRUE(
        co_gateway.revert_redemption(BENEFICIARY, PENALTY, hash).has_value());
    EXPECT_EQ(
        co_gateway.get_outbox_status(hash), MessageStatus::DeclaredRevocation);

    uint64_t height = relay_auxiliary();
    auto const confirmed = gateway.confirm_revert_redeem_intent(
        FACILITATOR, hash, height, prove_co_gateway_box(BoxSide::Outbox, hash));
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed.value().sender, BENEFICIARY);
    EXPECT_EQ(confirmed.value().nonce, 0);
    EXPECT_EQ(confirmed.value().amount, 500);
    EXPECT_EQ(gateway.get_inbox_status(hash), MessageStatus::Revoked);

    auto const unstaked = gateway.progress_unstake(FACILITATOR, hash, SECRET);
    ASSERT_TRUE(unstaked.has_error());
    EXPECT_EQ(unstaked.assume_error(), MessageBusError::InboxNotDeclared);

    height = relay_origin();
    ASSERT_TRUE(co_gateway
                    .progress_revert_redemption(
                        FACILITATOR,
                        hash,
                        height,
                        prove_gateway_box(BoxSide::Inbox, hash))
                    .has_value());
    EXPECT_EQ(co_gateway.get_outbox_status(hash), MessageStatus::Revoked);
    EXPECT_EQ(utility_token.balance_of(BENEFICIARY), 800);
    EXPECT_EQ(utility_token.balance_of(CO_GATEWAY), 0);
    EXPECT_EQ(utility_token.total_supply(), 1000);
    EXPECT_EQ(auxiliary.get_balance(BURNER), BOUNTY + PENALTY);
    EXPECT_EQ(auxiliary.get_balance(CO_GATEWAY), 0);
    EXPECT_EQ(value_token.balance_of(STAKE_VAULT), 1000);

    // a revoked redemption frees the redeemer for the next one
    EXPECT_EQ(co_gateway.get_nonce(BENEFICIARY), 1);
    redeem(100, 1, 50, 1);
}

TEST_F(CoGatewayTest, progress_revert_redemption_requires_revocation)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());

    uint64_t const height = relay_origin();
    auto const res = co_gateway.progress_revert_redemption(
        FACILITATOR, hash, height, prove_gateway_box(BoxSide::Inbox, hash));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::OutboxNotDeclaredRevocation);
}
