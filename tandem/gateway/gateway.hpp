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
#include <tandem/bus/message_registry.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/result.hpp>
#include <tandem/gateway/gateway_base.hpp>
#include <tandem/gateway/gateway_config.hpp>
#include <tandem/gateway/records.hpp>

#include <cstdint>

TANDEM_NAMESPACE_BEGIN

class State;
class StateRootProvider;
class Token;

// Origin end of a link. Stakes escrow value tokens that are mirrored by the
// utility token of the CoGateway, redemptions on the auxiliary chain release
// them from the stake vault.
class Gateway final : public GatewayBase
{
    Token &value_token_;
    MessageRegistry<Stake> stakes_;
    MessageRegistry<Unstake> unstakes_;

    /////////////
    // Events //
    /////////////

    // event StakeIntentDeclared(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     uint256         _stakerNonce,
    //     address         _beneficiary,
    //     uint256         _amount);
    void emit_stake_intent_declared_event(
        bytes32_t const &message_hash, Stake const &);

    // event StakeProgressed(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     uint256         _stakerNonce,
    //     uint256         _amount,
    //     bool            _proofProgress,
    //     bytes32         _unlockSecret);
    void emit_stake_progressed_event(
        bytes32_t const &message_hash, Stake const &, bool proof_progress,
        bytes32_t const &unlock_secret);

    // event RevertStakeIntentDeclared(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     uint256         _stakerNonce,
    //     uint256         _amount);
    void emit_revert_stake_intent_declared_event(
        bytes32_t const &message_hash, Stake const &);

    // event StakeReverted(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     uint256         _stakerNonce,
    //     uint256         _amount);
    void
    emit_stake_reverted_event(bytes32_t const &message_hash, Stake const &);

    // event RedeemIntentConfirmed(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     uint256         _redeemerNonce,
    //     address         _beneficiary,
    //     uint256         _amount,
    //     uint256         _blockHeight,
    //     bytes32         _hashLock);
    void emit_redeem_intent_confirmed_event(
        bytes32_t const &message_hash, Unstake const &, uint64_t block_height);

    // event UnstakeProgressed(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     address indexed _beneficiary,
    //     uint256         _redeemAmount,
    //     uint256         _unstakeAmount,
    //     uint256         _rewardAmount,
    //     bool            _proofProgress,
    //     bytes32         _unlockSecret);
    void emit_unstake_progressed_event(
        bytes32_t const &message_hash, Unstake const &,
        uint256_t const &unstake_amount, uint256_t const &reward_amount,
        bool proof_progress, bytes32_t const &unlock_secret);

    // event RevertRedeemIntentConfirmed(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     uint256         _redeemerNonce,
    //     uint256         _amount);
    void emit_revert_redeem_intent_confirmed_event(
        bytes32_t const &message_hash, Unstake const &);

    // event GatewayLinkInitiated(
    //     bytes32 indexed _messageHash,
    //     address indexed _gateway,
    //     address indexed _cogateway,
    //     address         _token);
    void emit_gateway_link_initiated_event(bytes32_t const &message_hash);

    /////////////
    // Helpers //
    /////////////
    Address const &gateway_address() const noexcept override
    {
        return ca_;
    }

    Address const &co_gateway_address() const noexcept override
    {
        return config_.counterpart;
    }

    Result<Stake> load_stake(bytes32_t const &message_hash);
    Result<Unstake> load_unstake(bytes32_t const &message_hash);

    Result<void> complete_stake(
        Address const &msg_sender, bytes32_t const &message_hash,
        Stake const &, bool proof_progress, bytes32_t const &unlock_secret);

    Result<void> complete_unstake(
        Address const &msg_sender, bytes32_t const &message_hash,
        Unstake const &, uint64_t initial_gas, bool proof_progress,
        bytes32_t const &unlock_secret);

public:
    Gateway(
        State &, Address const &ca, GatewayConfig const &,
        StateRootProvider const &, Token &value_token);

    ////////////////////
    // Stake and mint //
    ////////////////////

    // The staker approves the gateway for `amount` value tokens beforehand
    Result<bytes32_t> stake(
        Address const &msg_sender, uint256_t const &msg_value,
        uint256_t const &amount, Address const &beneficiary,
        uint256_t const &gas_price, uint256_t const &gas_limit,
        uint256_t const &nonce, bytes32_t const &hash_lock);

    Result<void> progress_stake(
        Address const &msg_sender, bytes32_t const &message_hash,
        bytes32_t const &unlock_secret);

    // Also completes a message whose revocation was declared after the mint
    // went through on the counterpart, the revocation penalty is burnt
    Result<void> progress_stake_with_proof(
        Address const &msg_sender, bytes32_t const &message_hash,
        byte_string_view proof, uint64_t block_height,
        MessageStatus claimed_status);

    Result<void> revert_stake(
        Address const &msg_sender, uint256_t const &msg_value,
        bytes32_t const &message_hash);

    Result<void> progress_revert_stake(
        Address const &msg_sender, bytes32_t const &message_hash,
        uint64_t block_height, byte_string_view proof);

    /////////////////////////
    // Redeem and unstake //
    /////////////////////////
    Result<bytes32_t> confirm_redeem_intent(
        Address const &msg_sender, Address const &redeemer,
        uint256_t const &nonce, Address const &beneficiary,
        uint256_t const &amount, uint256_t const &gas_price,
        uint256_t const &gas_limit, bytes32_t const &hash_lock,
        uint64_t block_height, byte_string_view proof);

    Result<void> progress_unstake(
        Address const &msg_sender, bytes32_t const &message_hash,
        bytes32_t const &unlock_secret);

    Result<void> progress_unstake_with_proof(
        Address const &msg_sender, bytes32_t const &message_hash,
        byte_string_view proof, uint64_t block_height,
        MessageStatus claimed_status);

    Result<RevertedIntent> confirm_revert_redeem_intent(
        Address const &msg_sender, bytes32_t const &message_hash,
        uint64_t block_height, byte_string_view proof);

    /////////////
    // Linking //
    /////////////
    Result<bytes32_t> initiate_gateway_link(
        Address const &msg_sender, uint256_t const &nonce,
        bytes32_t const &hash_lock);

    Result<void> activate_gateway(Address const &msg_sender);
    Result<void> deactivate_gateway(Address const &msg_sender);

    bool is_activated();

    uint256_t get_nonce(Address const &account) override;

    // Nonce of the next gateway link initiated by `account`
    uint256_t get_link_nonce(Address const &account);

    Result<Stake> get_stake(bytes32_t const &message_hash)
    {
        return load_stake(message_hash);
    }

    Result<Unstake> get_unstake(bytes32_t const &message_hash)
    {
        return load_unstake(message_hash);
    }
};

TANDEM_NAMESPACE_END
