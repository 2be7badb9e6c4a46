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

#include <tandem/anchor/state_root_provider.hpp>
#include <tandem/bus/message.hpp>
#include <tandem/bus/message_box.hpp>
#include <tandem/bus/message_bus_error.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/gateway/co_gateway.hpp>
#include <tandem/gateway/constants.hpp>
#include <tandem/gateway/gateway.hpp>
#include <tandem/gateway/gateway_error.hpp>
#include <tandem/gateway/intent.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/state.hpp>
#include <tandem/token/eip20_token.hpp>
#include <tandem/token/token_error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <type_traits>

using namespace tandem;
using namespace tandem::test;

namespace
{
    class FakeStateRootProvider final : public StateRootProvider
    {
        std::map<uint64_t, bytes32_t> roots_;

    public:
        void set(uint64_t const block_height, bytes32_t const &state_root)
        {
            roots_[block_height] = state_root;
        }

        bytes32_t get_state_root(uint64_t const block_height) const override
        {
            auto const it = roots_.find(block_height);
            return it == roots_.end() ? bytes32_t{} : it->second;
        }

        uint64_t get_latest_state_root_block_height() const override
        {
            return roots_.empty() ? 0 : roots_.rbegin()->first;
        }
    };
}

using GatewayTest = GatewayFixture;

struct UnlinkedGatewayTest : public GatewayFixture
{
    UnlinkedGatewayTest()
    {
        link_on_setup = false;
    }
};

TEST(Intent, typehashes)
{
    EXPECT_EQ(
        STAKE_INTENT_TYPEHASH,
        abi_signature_hash(
            "StakeIntent(uint256 amount,address beneficiary,address gateway)"));
    EXPECT_EQ(
        REDEEM_INTENT_TYPEHASH,
        abi_signature_hash("RedeemIntent(uint256 amount,address "
                           "beneficiary,address gateway)"));
    EXPECT_EQ(
        GATEWAY_LINK_TYPEHASH,
        abi_signature_hash("GatewayLink(bytes32 messageHash,Message message)"));
}

TEST(Intent, stake_intent_binds_every_argument)
{
    auto const intent = hash_stake_intent(1000, BENEFICIARY, GATEWAY);
    EXPECT_NE(intent, hash_stake_intent(1001, BENEFICIARY, GATEWAY));
    EXPECT_NE(intent, hash_stake_intent(1000, STAKER, GATEWAY));
    EXPECT_NE(intent, hash_stake_intent(1000, BENEFICIARY, CO_GATEWAY));
    EXPECT_NE(intent, hash_redeem_intent(1000, BENEFICIARY, GATEWAY));
}

TEST(Intent, link_intent_binds_token_metadata)
{
    auto const intent = hash_gateway_link_intent(
        GATEWAY, CO_GATEWAY, BOUNTY, "Value Token", "VT", 18, 0, VALUE_TOKEN);
    EXPECT_NE(
        intent,
        hash_gateway_link_intent(
            GATEWAY, CO_GATEWAY, BOUNTY, "Value Token", "VT", 6, 0, VALUE_TOKEN));
    EXPECT_NE(
        intent,
        hash_gateway_link_intent(
            GATEWAY, CO_GATEWAY, BOUNTY, "Value", "VT", 18, 0, VALUE_TOKEN));
    EXPECT_NE(
        intent,
        hash_gateway_link_intent(
            GATEWAY, CO_GATEWAY, BOUNTY, "Value Token", "VT", 18, 1, VALUE_TOKEN));
}

///////////////////
// Gateway link //
///////////////////

TEST_F(GatewayTest, linked)
{
    EXPECT_TRUE(gateway.is_linked());
    EXPECT_TRUE(co_gateway.is_linked());
    EXPECT_TRUE(gateway.is_activated());
    EXPECT_EQ(gateway.get_link_nonce(ORGANIZATION), 1);
    EXPECT_STREQ(gateway.role(), "Gateway");
    EXPECT_STREQ(co_gateway.role(), "CoGateway");

    auto const &log = auxiliary.logs().back();
    EXPECT_EQ(log.address, CO_GATEWAY);
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash(
            "GatewayLinkProgressed(bytes32,address,address,address,bool,"
            "bytes32)"));
    EXPECT_EQ(log.topics[2], abi_encode_address(GATEWAY));
    EXPECT_EQ(log.topics[3], abi_encode_address(CO_GATEWAY));
}

TEST_F(GatewayTest, link_twice)
{
    auto const res = gateway.initiate_gateway_link(
        ORGANIZATION, 1, to_hash_lock(LINK_SECRET));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::AlreadyLinked);
}

TEST_F(UnlinkedGatewayTest, not_linked)
{
    EXPECT_FALSE(gateway.is_linked());
    EXPECT_FALSE(co_gateway.is_linked());

    auto const staked = gateway.stake(
        STAKER, BOUNTY, 1000, BENEFICIARY, 2, 100, 0, to_hash_lock(SECRET));
    ASSERT_TRUE(staked.has_error());
    EXPECT_EQ(staked.assume_error(), GatewayError::NotLinked);

    auto const redeemed = co_gateway.redeem(
        BENEFICIARY, BOUNTY, 1000, STAKER, 2, 100, 0, to_hash_lock(SECRET));
    ASSERT_TRUE(redeemed.has_error());
    EXPECT_EQ(redeemed.assume_error(), GatewayError::NotLinked);
}

TEST_F(UnlinkedGatewayTest, link_only_organization)
{
    auto const res =
        gateway.initiate_gateway_link(STAKER, 0, to_hash_lock(LINK_SECRET));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::OnlyOrganization);
    EXPECT_EQ(gateway.get_link_nonce(STAKER), 0);
}

TEST_F(UnlinkedGatewayTest, link_rejects_intent_mismatch)
{
    auto const hash_lock = to_hash_lock(LINK_SECRET);
    auto const initiated =
        gateway.initiate_gateway_link(ORGANIZATION, 0, hash_lock);
    ASSERT_TRUE(initiated.has_value());

    uint64_t const height = relay_origin();
    auto const res = co_gateway.confirm_gateway_link_intent(
        FACILITATOR,
        link_intent(1),
        0,
        ORGANIZATION,
        hash_lock,
        height,
        prove_gateway_box(BoxSide::Outbox, initiated.value()));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::InvalidIntentHash);
    EXPECT_EQ(
        co_gateway.get_inbox_status(initiated.value()),
        MessageStatus::Undeclared);
}

TEST_F(UnlinkedGatewayTest, progress_unknown_link)
{
    auto const res = gateway.progress_gateway_link(
        ORGANIZATION, to_hash_lock(LINK_SECRET), LINK_SECRET);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::UnknownMessage);
}

TEST_F(UnlinkedGatewayTest, progress_link_wrong_secret)
{
    auto const initiated = gateway.initiate_gateway_link(
        ORGANIZATION, 0, to_hash_lock(LINK_SECRET));
    ASSERT_TRUE(initiated.has_value());

    auto const res = gateway.progress_gateway_link(
        ORGANIZATION, initiated.value(), SECRET);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::InvalidUnlockSecret);
    EXPECT_FALSE(gateway.is_linked());
}

TEST_F(GatewayTest, deactivate)
{
    ASSERT_TRUE(gateway.deactivate_gateway(ORGANIZATION).has_value());
    EXPECT_FALSE(gateway.is_activated());

    auto const staked = gateway.stake(
        STAKER, BOUNTY, 1000, BENEFICIARY, 2, 100, 0, to_hash_lock(SECRET));
    ASSERT_TRUE(staked.has_error());
    EXPECT_EQ(staked.assume_error(), GatewayError::NotActivated);

    auto const again = gateway.deactivate_gateway(ORGANIZATION);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), GatewayError::NotActivated);

    auto const activated = gateway.activate_gateway(STAKER);
    ASSERT_TRUE(activated.has_error());
    EXPECT_EQ(activated.assume_error(), GatewayError::OnlyOrganization);
}

///////////////////////
// Proving gateways //
///////////////////////

TEST_F(GatewayTest, prove_gateway_twice)
{
    uint64_t const height = relay_origin();
    auto const proven = co_gateway.get_storage_root(height);
    EXPECT_EQ(proven, origin.storage_root(GATEWAY));

    auto const res = co_gateway.prove_gateway(
        height, origin.encode_account(GATEWAY), origin.prove_account(GATEWAY));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), proven);

    auto const &log = auxiliary.logs().back();
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash("GatewayProven(address,uint256,bytes32,bool)"));
    ASSERT_EQ(log.data.size(), 96u);
    EXPECT_EQ(log.data[95], 1);
}

TEST_F(GatewayTest, prove_gateway_unknown_height)
{
    auto const res = co_gateway.prove_gateway(
        1000, origin.encode_account(GATEWAY), origin.prove_account(GATEWAY));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::StateRootNotFound);
}

TEST(Gateway, contracts_are_not_copyable)
{
    // storage variables refer to the contract address of their owner
    static_assert(!std::is_copy_constructible_v<Gateway>);
    static_assert(!std::is_move_constructible_v<Gateway>);
    static_assert(!std::is_copy_assignable_v<Gateway>);
    static_assert(!std::is_copy_constructible_v<CoGateway>);
    static_assert(!std::is_move_constructible_v<CoGateway>);
    static_assert(!std::is_copy_constructible_v<EIP20Token>);
    static_assert(!std::is_move_constructible_v<EIP20Token>);
}

TEST(ProveGateway, storage_root_mismatch)
{
    State origin;
    State auxiliary;
    FakeStateRootProvider roots;
    EIP20Token utility_token{auxiliary, UTILITY_TOKEN, CO_GATEWAY};
    CoGateway co_gateway{
        auxiliary, CO_GATEWAY, make_config(GATEWAY), roots, utility_token};

    origin.create_contract(GATEWAY, GATEWAY_CODE_HASH);
    origin.set_storage(GATEWAY, bytes32_t{1}, bytes32_t{2});
    roots.set(7, origin.state_root());

    auto const first = co_gateway.prove_gateway(
        7, origin.encode_account(GATEWAY), origin.prove_account(GATEWAY));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), origin.storage_root(GATEWAY));

    origin.set_storage(GATEWAY, bytes32_t{1}, bytes32_t{3});
    roots.set(7, origin.state_root());

    auto const second = co_gateway.prove_gateway(
        7, origin.encode_account(GATEWAY), origin.prove_account(GATEWAY));
    ASSERT_TRUE(second.has_error());
    EXPECT_EQ(second.assume_error(), GatewayError::StorageRootMismatch);
    EXPECT_EQ(co_gateway.get_storage_root(7), first.value());
}

TEST(ProveGateway, tampered_account)
{
    State origin;
    State auxiliary;
    FakeStateRootProvider roots;
    EIP20Token utility_token{auxiliary, UTILITY_TOKEN, CO_GATEWAY};
    CoGateway co_gateway{
        auxiliary, CO_GATEWAY, make_config(GATEWAY), roots, utility_token};

    origin.create_contract(GATEWAY, GATEWAY_CODE_HASH);
    origin.set_storage(GATEWAY, bytes32_t{1}, bytes32_t{2});
    roots.set(7, origin.state_root());

    // account of another contract, proven with the gateway's path
    origin.create_contract(VALUE_TOKEN, GATEWAY_CODE_HASH);
    roots.set(8, origin.state_root());
    auto const res = co_gateway.prove_gateway(
        8, origin.encode_account(VALUE_TOKEN), origin.prove_account(GATEWAY));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(co_gateway.get_storage_root(8), bytes32_t{});
}

///////////////////////
// Stake and unstake //
///////////////////////

TEST_F(GatewayTest, stake)
{
    auto const hash = stake(1000);

    EXPECT_EQ(gateway.get_outbox_status(hash), MessageStatus::Declared);
    EXPECT_EQ(gateway.get_nonce(STAKER), 1);
    EXPECT_EQ(value_token.balance_of(STAKER), INITIAL_VALUE - 1000);
    EXPECT_EQ(value_token.balance_of(GATEWAY), 1000);
    EXPECT_EQ(origin.get_balance(STAKER), INITIAL_VALUE - BOUNTY);
    EXPECT_EQ(origin.get_balance(GATEWAY), BOUNTY);

    auto const record = gateway.get_stake(hash);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().amount.native(), 1000);
    EXPECT_EQ(record.value().beneficiary, BENEFICIARY);
    EXPECT_EQ(record.value().bounty.native(), BOUNTY);
    EXPECT_EQ(record.value().message.sender, STAKER);
    EXPECT_EQ(
        record.value().message.intent_hash,
        hash_stake_intent(1000, BENEFICIARY, GATEWAY));

    auto const &log = origin.logs().back();
    EXPECT_EQ(log.address, GATEWAY);
    ASSERT_EQ(log.topics.size(), 3u);
    EXPECT_EQ(
        log.topics[0],
        abi_signature_hash(
            "StakeIntentDeclared(bytes32,address,uint256,address,uint256)"));
    EXPECT_EQ(log.topics[1], hash);
    EXPECT_EQ(log.topics[2], abi_encode_address(STAKER));
}

TEST_F(GatewayTest, stake_argument_checks)
{
    auto const hash_lock = to_hash_lock(SECRET);

    auto res =
        gateway.stake(STAKER, BOUNTY, 0, BENEFICIARY, 2, 100, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroAmount);

    res = gateway.stake(STAKER, BOUNTY, 1000, Address{}, 2, 100, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroBeneficiary);

    res = gateway.stake(
        STAKER, BOUNTY, 1000, BENEFICIARY, 2, 100, 0, bytes32_t{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::ZeroHashLock);

    res = gateway.stake(STAKER, 0, 1000, BENEFICIARY, 2, 100, 0, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::InvalidBounty);

    res = gateway.stake(STAKER, BOUNTY, 1000, BENEFICIARY, 2, 100, 1, hash_lock);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::InvalidNonce);

    EXPECT_EQ(gateway.get_nonce(STAKER), 0);
}

TEST_F(GatewayTest, stake_rolls_back_on_error)
{
    auto const logs = origin.logs().size();
    auto const res = gateway.stake(
        STAKER,
        BOUNTY,
        INITIAL_VALUE + 1,
        BENEFICIARY,
        2,
        100,
        0,
        to_hash_lock(SECRET));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);

    EXPECT_EQ(gateway.get_nonce(STAKER), 0);
    EXPECT_EQ(value_token.balance_of(STAKER), INITIAL_VALUE);
    EXPECT_EQ(origin.get_balance(STAKER), INITIAL_VALUE);
    EXPECT_EQ(origin.logs().size(), logs);
}

TEST_F(GatewayTest, stake_requires_approval)
{
    ASSERT_TRUE(value_token.approve(STAKER, GATEWAY, 999).has_value());
    auto const res = gateway.stake(
        STAKER, BOUNTY, 1000, BENEFICIARY, 2, 100, 0, to_hash_lock(SECRET));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientAllowance);
    EXPECT_EQ(gateway.get_nonce(STAKER), 0);
    EXPECT_EQ(value_token.balance_of(STAKER), INITIAL_VALUE);
    EXPECT_EQ(value_token.allowance(STAKER, GATEWAY), 999);

    stake(999);
    EXPECT_EQ(value_token.allowance(STAKER, GATEWAY), 0);
}

TEST_F(GatewayTest, stake_requires_completed_previous)
{
    stake(1000);
    auto const res = gateway.stake(
        STAKER, BOUNTY, 1000, BENEFICIARY, 2, 100, 1, to_hash_lock(SECRET));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::PreviousProcessNotCompleted);
}

TEST_F(GatewayTest, stake_after_completed_previous)
{
    auto const first = stake_and_mint(1000);
    auto const second = stake(500, 2, 100, 1);

    EXPECT_NE(first, second);
    EXPECT_EQ(gateway.get_nonce(STAKER), 2);
    // the superseded record is deleted
    auto const res = gateway.get_stake(first);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::UnknownMessage);
}

TEST_F(GatewayTest, progress_stake)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(
        gateway.progress_stake(FACILITATOR, hash, SECRET).has_value());

    EXPECT_EQ(gateway.get_outbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(value_token.balance_of(GATEWAY), 0);
    EXPECT_EQ(value_token.balance_of(STAKE_VAULT), 1000);
    EXPECT_EQ(origin.get_balance(FACILITATOR), INITIAL_VALUE + BOUNTY);
    EXPECT_EQ(origin.get_balance(GATEWAY), 0);

    auto const again = gateway.progress_stake(FACILITATOR, hash, SECRET);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), MessageBusError::OutboxNotDeclared);
}

TEST_F(GatewayTest, progress_stake_wrong_secret)
{
    auto const hash = stake(1000);
    auto const res = gateway.progress_stake(FACILITATOR, hash, LINK_SECRET);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::InvalidUnlockSecret);
    EXPECT_EQ(gateway.get_outbox_status(hash), MessageStatus::Declared);
    EXPECT_EQ(origin.get_balance(FACILITATOR), INITIAL_VALUE);
}

TEST_F(GatewayTest, progress_unknown_stake)
{
    auto const res =
        gateway.progress_stake(FACILITATOR, to_hash_lock(SECRET), SECRET);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::UnknownMessage);
}

TEST_F(GatewayTest, progress_stake_with_proof)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());
    ASSERT_TRUE(
        co_gateway.progress_mint(FACILITATOR, hash, SECRET).has_value());

    uint64_t const height = relay_auxiliary();
    auto const proof = prove_co_gateway_box(BoxSide::Inbox, hash);

    auto const unproven = gateway.progress_stake_with_proof(
        FACILITATOR, hash, proof, height + 1, MessageStatus::Progressed);
    ASSERT_TRUE(unproven.has_error());
    EXPECT_EQ(unproven.assume_error(), GatewayError::StorageRootNotFound);

    ASSERT_TRUE(gateway
                    .progress_stake_with_proof(
                        FACILITATOR,
                        hash,
                        proof,
                        height,
                        MessageStatus::Progressed)
                    .has_value());
    EXPECT_EQ(gateway.get_outbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(value_token.balance_of(STAKE_VAULT), 1000);
    EXPECT_EQ(origin.get_balance(FACILITATOR), INITIAL_VALUE + BOUNTY);
}

TEST_F(GatewayTest, progress_stake_after_late_revocation)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());
    ASSERT_TRUE(gateway.revert_stake(STAKER, PENALTY, hash).has_value());

    // the mint completes before the revocation reaches auxiliary
    ASSERT_TRUE(
        co_gateway.progress_mint(FACILITATOR, hash, SECRET).has_value());
    uint64_t const height = relay_auxiliary();
    auto const proof = prove_co_gateway_box(BoxSide::Inbox, hash);

    auto const reverted =
        gateway.progress_revert_stake(FACILITATOR, hash, height, proof);
    ASSERT_TRUE(reverted.has_error());
    EXPECT_EQ(
        reverted.assume_error(), MessageBusError::MerkleProofVerificationFailed);

    // only a progressed inbox overrides the revocation
    auto const declared = gateway.progress_stake_with_proof(
        FACILITATOR, hash, proof, height, MessageStatus::Declared);
    ASSERT_TRUE(declared.has_error());
    EXPECT_EQ(declared.assume_error(), MessageBusError::OutboxNotDeclared);
    EXPECT_EQ(
        gateway.get_outbox_status(hash), MessageStatus::DeclaredRevocation);

    ASSERT_TRUE(gateway
                    .progress_stake_with_proof(
                        FACILITATOR,
                        hash,
                        proof,
                        height,
                        MessageStatus::Progressed)
                    .has_value());
    EXPECT_EQ(gateway.get_outbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(value_token.balance_of(GATEWAY), 0);
    EXPECT_EQ(value_token.balance_of(STAKE_VAULT), 1000);
    EXPECT_EQ(origin.get_balance(FACILITATOR), INITIAL_VALUE + BOUNTY);
    EXPECT_EQ(origin.get_balance(BURNER), PENALTY);
    EXPECT_EQ(origin.get_balance(GATEWAY), 0);
    EXPECT_EQ(origin.get_balance(STAKER), INITIAL_VALUE - BOUNTY - PENALTY);

    // the staker can move on to the next stake
    EXPECT_EQ(gateway.get_nonce(STAKER), 1);
    stake(500, 2, 100, 1);
}

TEST_F(GatewayTest, revert_stake)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());

    auto res = gateway.revert_stake(FACILITATOR, PENALTY, hash);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::OnlyStaker);

    res = gateway.revert_stake(STAKER, BOUNTY, hash);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GatewayError::InvalidPenalty);

    ASSERT_TRUE(gateway.revert_stake(STAKER, PENALTY, hash).has_value());
    EXPECT_EQ(
        gateway.get_outbox_status(hash), MessageStatus::DeclaredRevocation);
    EXPECT_EQ(origin.get_balance(GATEWAY), BOUNTY + PENALTY);

    // a declared revocation can no longer be progressed with the secret
    auto const progressed = gateway.progress_stake(FACILITATOR, hash, SECRET);
    ASSERT_TRUE(progressed.has_error());
    EXPECT_EQ(progressed.assume_error(), MessageBusError::OutboxNotDeclared);

    uint64_t height = relay_origin();
    auto const confirmed = co_gateway.confirm_revert_stake_intent(
        FACILITATOR, hash, height, prove_gateway_box(BoxSide::Outbox, hash));
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed.value().sender, STAKER);
    EXPECT_EQ(confirmed.value().nonce, 0);
    EXPECT_EQ(confirmed.value().amount, 1000);
    EXPECT_EQ(co_gateway.get_inbox_status(hash), MessageStatus::Revoked);

    auto const minted = co_gateway.progress_mint(FACILITATOR, hash, SECRET);
    ASSERT_TRUE(minted.has_error());
    EXPECT_EQ(minted.assume_error(), MessageBusError::InboxNotDeclared);

    height = relay_auxiliary();
    ASSERT_TRUE(gateway
                    .progress_revert_stake(
                        FACILITATOR,
                        hash,
                        height,
                        prove_co_gateway_box(BoxSide::Inbox, hash))
                    .has_value());
    EXPECT_EQ(gateway.get_outbox_status(hash), MessageStatus::Revoked);
    EXPECT_EQ(value_token.balance_of(STAKER), INITIAL_VALUE);
    EXPECT_EQ(value_token.balance_of(GATEWAY), 0);
    EXPECT_EQ(origin.get_balance(BURNER), BOUNTY + PENALTY);
    EXPECT_EQ(origin.get_balance(GATEWAY), 0);
    EXPECT_EQ(origin.get_balance(STAKER), INITIAL_VALUE - BOUNTY - PENALTY);
    EXPECT_EQ(utility_token.total_supply(), 0);
}

TEST_F(GatewayTest, progress_revert_stake_requires_remote_revocation)
{
    auto const hash = stake(1000);
    ASSERT_TRUE(confirm_stake(1000).has_value());
    ASSERT_TRUE(gateway.revert_stake(STAKER, PENALTY, hash).has_value());

    // the inbox is still Declared on auxiliary
    uint64_t const height = relay_auxiliary();
    auto const res = gateway.progress_revert_stake(
        FACILITATOR,
        hash,
        height,
        prove_co_gateway_box(BoxSide::Inbox, hash));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::MerkleProofVerificationFailed);
    EXPECT_EQ(
        gateway.get_outbox_status(hash), MessageStatus::DeclaredRevocation);
    EXPECT_EQ(value_token.balance_of(GATEWAY), 1000);
}

TEST_F(GatewayTest, unstake)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);

    auto const confirmed = confirm_redeem(500);
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed.value(), hash);
    EXPECT_EQ(gateway.get_inbox_status(hash), MessageStatus::Declared);

    auto const record = gateway.get_unstake(hash);
    ASSERT_TRUE(record.has_value());
    EXPECT_GT(record.value().message.gas_consumed.native(), 0);

    ASSERT_TRUE(
        gateway.progress_unstake(FACILITATOR, hash, SECRET).has_value());
    EXPECT_EQ(gateway.get_inbox_status(hash), MessageStatus::Progressed);

    // gas_limit 50 at gas_price 1
    EXPECT_EQ(value_token.balance_of(STAKER), INITIAL_VALUE - 1000 + 450);
    EXPECT_EQ(value_token.balance_of(FACILITATOR), 50);
    EXPECT_EQ(value_token.balance_of(STAKE_VAULT), 500);
}

TEST_F(GatewayTest, confirm_redeem_twice)
{
    stake_and_mint(1000);
    redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());

    auto const res = confirm_redeem(500);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MessageBusError::InvalidNonce);
}

TEST_F(GatewayTest, confirm_redeem_rejects_other_amount)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    uint64_t const height = relay_auxiliary();

    auto const res = gateway.confirm_redeem_intent(
        FACILITATOR,
        BENEFICIARY,
        0,
        STAKER,
        499,
        1,
        50,
        to_hash_lock(SECRET),
        height,
        prove_co_gateway_box(BoxSide::Outbox, hash));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(gateway.get_inbox_status(hash), MessageStatus::Undeclared);
    EXPECT_EQ(gateway.get_nonce(BENEFICIARY), 0);
}

TEST_F(GatewayTest, progress_unstake_with_proof)
{
    stake_and_mint(1000);
    auto const hash = redeem(500);
    ASSERT_TRUE(confirm_redeem(500).has_value());

    ASSERT_TRUE(
        co_gateway.progress_redeem(FACILITATOR, hash, SECRET).has_value());
    uint64_t const height = relay_auxiliary();

    auto const claimed_revoked = gateway.progress_unstake_with_proof(
        FACILITATOR,
        hash,
        prove_co_gateway_box(BoxSide::Outbox, hash),
        height,
        MessageStatus::Revoked);
    ASSERT_TRUE(claimed_revoked.has_error());
    EXPECT_EQ(
        claimed_revoked.assume_error(), MessageBusError::InvalidClaimedStatus);

    auto const claimed_declared = gateway.progress_unstake_with_proof(
        FACILITATOR,
        hash,
        prove_co_gateway_box(BoxSide::Outbox, hash),
        height,
        MessageStatus::Declared);
    ASSERT_TRUE(claimed_declared.has_error());
    EXPECT_EQ(
        claimed_declared.assume_error(),
        MessageBusError::MerkleProofVerificationFailed);

    ASSERT_TRUE(gateway
                    .progress_unstake_with_proof(
                        FACILITATOR,
                        hash,
                        prove_co_gateway_box(BoxSide::Outbox, hash),
                        height,
                        MessageStatus::Progressed)
                    .has_value());
    EXPECT_EQ(gateway.get_inbox_status(hash), MessageStatus::Progressed);
    EXPECT_EQ(value_token.balance_of(STAKER), INITIAL_VALUE - 1000 + 450);
}
