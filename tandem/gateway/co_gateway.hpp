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
class UtilityToken;

// Auxiliary end of a link. Confirmed stakes mint the utility token,
// redemptions escrow and finally burn it.
class CoGateway final : public GatewayBase
{
    UtilityToken &utility_token_;
    MessageRegistry<Redeem> redeems_;
    MessageRegistry<Mint> mints_;

    /////////////
    // Events //
    /////////////

    // event StakeIntentConfirmed(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     uint256         _stakerNonce,
    //     address         _beneficiary,
    //     uint256         _amount,
    //     uint256         _blockHeight,
    //     bytes32         _hashLock);
    void emit_stake_intent_confirmed_event(
        bytes32_t const &message_hash, Mint const &, uint64_t block_height);

    // event MintProgressed(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     address indexed _beneficiary,
    //     uint256         _stakeAmount,
    //     uint256         _mintedAmount,
    //     uint256         _rewardAmount,
    //     bool            _proofProgress,
    //     bytes32         _unlockSecret);
    void emit_mint_progressed_event(
        bytes32_t const &message_hash, Mint const &,
        uint256_t const &minted_amount, uint256_t const &reward_amount,
        bool proof_progress, bytes32_t const &unlock_secret);

    // event RevertStakeIntentConfirmed(
    //     bytes32 indexed _messageHash,
    //     address indexed _staker,
    //     uint256         _stakerNonce,
    //     uint256         _amount);
    void emit_revert_stake_intent_confirmed_event(
        bytes32_t const &message_hash, Mint const &);

    // event RedeemIntentDeclared(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     uint256         _redeemerNonce,
    //     address         _beneficiary,
    //     uint256         _amount);
    void emit_redeem_intent_declared_event(
        bytes32_t const &message_hash, Redeem const &);

    // event RedeemProgressed(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     uint256         _redeemerNonce,
    //     uint256         _amount,
    //     bool            _proofProgress,
    //     bytes32         _unlockSecret);
    void emit_redeem_progressed_event(
        bytes32_t const &message_hash, Redeem const &, bool proof_progress,
        bytes32_t const &unlock_secret);

    // event RevertRedeemDeclared(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     uint256         _redeemerNonce,
    //     uint256         _amount);
    void emit_revert_redeem_declared_event(
        bytes32_t const &message_hash, Redeem const &);

    // event RedeemReverted(
    //     bytes32 indexed _messageHash,
    //     address indexed _redeemer,
    //     uint256         _redeemerNonce,
    //     uint256         _amount);
    void emit_redeem_reverted_event(
        bytes32_t const &message_hash, Redeem const &);

    // event GatewayLinkConfirmed(
    //     bytes32 indexed _messageHash,
    //     address indexed _gateway,
    //     address indexed _cogateway,
    //     address         _token);
    void emit_gateway_link_confirmed_event(bytes32_t const &message_hash);

    /////////////
    // Helpers //
    /////////////
    Address const &gateway_address() const noexcept override
    {
        return config_.counterpart;
    }

    Address const &co_gateway_address() const noexcept override
    {
        return ca_;
    }

    Result<Mint> load_mint(bytes32_t const &message_hash);
    Result<Redeem> load_redeem(bytes32_t const &message_hash);

    Result<void> complete_mint(
        Address const &msg_sender, bytes32_t const &message_hash,
        Mint const &, uint64_t initial_gas, bool proof_progress,
        bytes32_t const &unlock_secret);

    Result<void> complete_redeem(
        Address const &msg_sender, bytes32_t const &message_hash,
        Redeem const &, bool proof_progress, bytes32_t const &unlock_secret);

public:
    CoGateway(
        State &, Address const &ca, GatewayConfig const &,
        StateRootProvider const &, UtilityToken &utility_token);

    ////////////////////
    // Stake and mint //
    ////////////////////
    Result<bytes32_t> confirm_stake_intent(
        Address const &msg_sender, Address const &staker,
        uint256_t const &nonce, Address const &beneficiary,
        uint256_t const &amount, uint256_t const &gas_price,
        uint256_t const &gas_limit, bytes32_t const &hash_lock,
        uint64_t block_height, byte_string_view proof);

    Result<void> progress_mint(
        Address const &msg_sender, bytes32_t const &message_hash,
        bytes32_t const &unlock_secret);

    Result<void> progress_mint_with_proof(
        Address const &msg_sender, bytes32_t const &message_hash,
        byte_string_view proof, uint64_t block_height,
        MessageStatus claimed_status);

    Result<RevertedIntent> confirm_revert_stake_intent(
        Address const &msg_sender, bytes32_t const &message_hash,
        uint64_t block_height, byte_string_view proof);

    /////////////////////////
    // Redeem and unstake //
    /////////////////////////

    // Escrows `amount` utility tokens of the redeemer, who approves the
    // co-gateway beforehand
    Result<bytes32_t> redeem(
        Address const &msg_sender, uint256_t const &msg_value,
        uint256_t const &amount, Address const &beneficiary,
        uint256_t const &gas_price, uint256_t const &gas_limit,
        uint256_t const &nonce, bytes32_t const &hash_lock);

    Result<void> progress_redeem(
        Address const &msg_sender, bytes32_t const &message_hash,
        bytes32_t const &unlock_secret);

    // Also completes a message whose revocation was declared after the unstake
    // went through on the counterpart, the revocation penalty is burnt
    Result<void> progress_redeem_with_proof(
        Address const &msg_sender, bytes32_t const &message_hash,
        byte_string_view proof, uint64_t block_height,
        MessageStatus claimed_status);

    Result<void> revert_redemption(
        Address const &msg_sender, uint256_t const &msg_value,
        bytes32_t const &message_hash);

    Result<void> progress_revert_redemption(
        Address const &msg_sender, bytes32_t const &message_hash,
        uint64_t block_height, byte_string_view proof);

    /////////////
    // Linking //
    /////////////
    Result<bytes32_t> confirm_gateway_link_intent(
        Address const &msg_sender, bytes32_t const &intent_hash,
        uint256_t const &nonce, Address const &sender,
        bytes32_t const &hash_lock, uint64_t block_height,
        byte_string_view proof);

    uint256_t get_nonce(Address const &account) override;

    Result<Mint> get_mint(bytes32_t const &message_hash)
    {
        return load_mint(message_hash);
    }

    Result<Redeem> get_redeem(bytes32_t const &message_hash)
    {
        return load_redeem(message_hash);
    }
};

TANDEM_NAMESPACE_END
