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

#include <tandem/anchor/state_root_provider.hpp>
#include <tandem/bus/message_bus.hpp>
#include <tandem/core/fmt/address_fmt.hpp>
#include <tandem/core/fmt/bytes_fmt.hpp>
#include <tandem/core/likely.h>
#include <tandem/gateway/gateway.hpp>
#include <tandem/gateway/gateway_error.hpp>
#include <tandem/gateway/intent.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/events.hpp>
#include <tandem/state/state.hpp>
#include <tandem/token/token.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

TANDEM_NAMESPACE_BEGIN

Gateway::Gateway(
    State &state, Address const &ca, GatewayConfig const &config,
    StateRootProvider const &state_root_provider, Token &value_token)
    : GatewayBase{state, ca, config, state_root_provider, BoxSide::Outbox}
    , value_token_{value_token}
    , stakes_{
          state,
          ca_,
          box_,
          BoxSide::Outbox,
          Variables::PrefixOutboxRecord,
          Variables::PrefixOutboxActiveProcess}
    , unstakes_{
          state,
          ca_,
          box_,
          BoxSide::Inbox,
          Variables::PrefixInboxRecord,
          Variables::PrefixInboxActiveProcess}
{
}

/////////////
// Events //
/////////////
void Gateway::emit_stake_intent_declared_event(
    bytes32_t const &message_hash, Stake const &stake)
{
    constexpr bytes32_t signature{
        0x1dc8ba34c8d75b6e750df7dadcf65dd6d6a7910483bcea2779971f587bade954_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(stake.message.sender))
            .add_data(to_byte_string_view(abi_encode_int(stake.message.nonce)))
            .add_data(
                to_byte_string_view(abi_encode_address(stake.beneficiary)))
            .add_data(to_byte_string_view(abi_encode_int(stake.amount)))
            .build();
    state_.store_log(event);
}

void Gateway::emit_stake_progressed_event(
    bytes32_t const &message_hash, Stake const &stake,
    bool const proof_progress, bytes32_t const &unlock_secret)
{
    constexpr bytes32_t signature{
        0xdad617859b2a7c1564706e0938a2689fb1e47e43494954d08b90fb7dff784a8b_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(stake.message.sender))
            .add_data(to_byte_string_view(abi_encode_int(stake.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(stake.amount)))
            .add_data(to_byte_string_view(abi_encode_bool(proof_progress)))
            .add_data(to_byte_string_view(unlock_secret))
            .build();
    state_.store_log(event);
}

void Gateway::emit_revert_stake_intent_declared_event(
    bytes32_t const &message_hash, Stake const &stake)
{
    constexpr bytes32_t signature{
        0x7db334432ffc05820ab5581a94da967946ca219ccb89a376bbfff75d7bf15592_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(stake.message.sender))
            .add_data(to_byte_string_view(abi_encode_int(stake.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(stake.amount)))
            .build();
    state_.store_log(event);
}

void Gateway::emit_stake_reverted_event(
    bytes32_t const &message_hash, Stake const &stake)
{
    constexpr bytes32_t signature{
        0x4259cc74a1169febcb3cb858142524599da133401841e489e8add6adbb273b4a_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(stake.message.sender))
            .add_data(to_byte_string_view(abi_encode_int(stake.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(stake.amount)))
            .build();
    state_.store_log(event);
}

void Gateway::emit_redeem_intent_confirmed_event(
    bytes32_t const &message_hash, Unstake const &unstake,
    uint64_t const block_height)
{
    constexpr bytes32_t signature{
        0xba4ac3e715e17f26685ca6074bc68752bdaf9c2ed6d196b7c8ebf0a445601a9c_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(unstake.message.sender))
            .add_data(
                to_byte_string_view(abi_encode_int(unstake.message.nonce)))
            .add_data(
                to_byte_string_view(abi_encode_address(unstake.beneficiary)))
            .add_data(to_byte_string_view(abi_encode_int(unstake.amount)))
            .add_data(to_byte_string_view(abi_encode_int(u64_be{block_height})))
            .add_data(to_byte_string_view(unstake.message.hash_lock))
            .build();
    state_.store_log(event);
}

void Gateway::emit_unstake_progressed_event(
    bytes32_t const &message_hash, Unstake const &unstake,
    uint256_t const &unstake_amount, uint256_t const &reward_amount,
    bool const proof_progress, bytes32_t const &unlock_secret)
{
    constexpr bytes32_t signature{
        0x2c66eee0de9967ff72fb960370f68331f353fcd49c1cf2b39257616093a3c740_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(unstake.message.sender))
            .add_topic(abi_encode_address(unstake.beneficiary))
            .add_data(to_byte_string_view(abi_encode_int(unstake.amount)))
            .add_data(to_byte_string_view(abi_encode_int(u256_be{unstake_amount})))
            .add_data(to_byte_string_view(abi_encode_int(u256_be{reward_amount})))
            .add_data(to_byte_string_view(abi_encode_bool(proof_progress)))
            .add_data(to_byte_string_view(unlock_secret))
            .build();
    state_.store_log(event);
}

void Gateway::emit_revert_redeem_intent_confirmed_event(
    bytes32_t const &message_hash, Unstake const &unstake)
{
    constexpr bytes32_t signature{
        0x12021c0985bb18bfab585272868c2e2ae2db7b7bae483560daa5b51788a5decc_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(unstake.message.sender))
            .add_data(
                to_byte_string_view(abi_encode_int(unstake.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(unstake.amount)))
            .build();
    state_.store_log(event);
}

void Gateway::emit_gateway_link_initiated_event(bytes32_t const &message_hash)
{
    constexpr bytes32_t signature{
        0x3c0d458e73cf1ebbb85694e93aed7b465b1798a3efa8c28f7fb493e4721f5ca8_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(message_hash)
                           .add_topic(abi_encode_address(ca_))
                           .add_topic(abi_encode_address(config_.counterpart))
                           .add_data(to_byte_string_view(
                               abi_encode_address(config_.value_token)))
                           .build();
    state_.store_log(event);
}

/////////////
// Helpers //
/////////////
Result<Stake> Gateway::load_stake(bytes32_t const &message_hash)
{
    auto const stake = stakes_.record(message_hash).load_checked();
    if (TANDEM_UNLIKELY(!stake.has_value())) {
        return GatewayError::UnknownMessage;
    }
    return stake.value();
}

Result<Unstake> Gateway::load_unstake(bytes32_t const &message_hash)
{
    auto const unstake = unstakes_.record(message_hash).load_checked();
    if (TANDEM_UNLIKELY(!unstake.has_value())) {
        return GatewayError::UnknownMessage;
    }
    return unstake.value();
}

// Escrowed value moves to the stake vault, the bounty to the facilitator
Result<void> Gateway::complete_stake(
    Address const &msg_sender, bytes32_t const &message_hash,
    Stake const &stake, bool const proof_progress,
    bytes32_t const &unlock_secret)
{
    BOOST_OUTCOME_TRY(value_token_.transfer(
        ca_, ca_, config_.stake_vault, stake.amount.native()));
    send_value(msg_sender, stake.bounty.native());
    emit_stake_progressed_event(
        message_hash, stake, proof_progress, unlock_secret);
    return outcome::success();
}

Result<void> Gateway::complete_unstake(
    Address const &msg_sender, bytes32_t const &message_hash,
    Unstake const &unstake, uint64_t const initial_gas,
    bool const proof_progress, bytes32_t const &unlock_secret)
{
    uint256_t const amount = unstake.amount.native();
    BOOST_OUTCOME_TRY(
        auto const fee, fee_of(unstake.message, initial_gas, amount));
    uint256_t const unstake_amount = amount - fee;

    BOOST_OUTCOME_TRY(value_token_.transfer(
        ca_, config_.stake_vault, unstake.beneficiary, unstake_amount));
    if (fee != 0) {
        BOOST_OUTCOME_TRY(value_token_.transfer(
            ca_, config_.stake_vault, msg_sender, fee));
    }
    emit_unstake_progressed_event(
        message_hash,
        unstake,
        unstake_amount,
        fee,
        proof_progress,
        unlock_secret);
    return outcome::success();
}

////////////////////
// Stake and mint //
////////////////////
Result<bytes32_t> Gateway::stake(
    Address const &msg_sender, uint256_t const &msg_value,
    uint256_t const &amount, Address const &beneficiary,
    uint256_t const &gas_price, uint256_t const &gas_limit,
    uint256_t const &nonce, bytes32_t const &hash_lock)
{
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(require_linked());
    if (TANDEM_UNLIKELY(!vars.activated.load())) {
        return GatewayError::NotActivated;
    }
    if (TANDEM_UNLIKELY(amount == 0)) {
        return GatewayError::ZeroAmount;
    }
    if (TANDEM_UNLIKELY(beneficiary == Address{})) {
        return GatewayError::ZeroBeneficiary;
    }
    if (TANDEM_UNLIKELY(hash_lock == bytes32_t{})) {
        return GatewayError::ZeroHashLock;
    }
    if (TANDEM_UNLIKELY(msg_value != config_.bounty)) {
        return GatewayError::InvalidBounty;
    }

    Stake const stake{
        .amount = amount,
        .beneficiary = beneficiary,
        .bounty = config_.bounty,
        .message = Message{
            .intent_hash = hash_stake_intent(amount, beneficiary, ca_),
            .nonce = nonce,
            .gas_price = gas_price,
            .gas_limit = gas_limit,
            .sender = msg_sender,
            .hash_lock = hash_lock,
            .gas_consumed = uint256_t{0}}};
    bytes32_t const message_hash = tandem::message_hash(stake.message);

    BOOST_OUTCOME_TRY(
        stakes_.initiate_new_process(msg_sender, nonce, message_hash, stake));
    BOOST_OUTCOME_TRY(value_token_.transfer(ca_, msg_sender, ca_, amount));
    BOOST_OUTCOME_TRY(receive_value(msg_sender, msg_value));
    BOOST_OUTCOME_TRY(declare_message(box_, stake.message));
    emit_stake_intent_declared_event(message_hash, stake);

    checkpoint.accept();
    return message_hash;
}

Result<void> Gateway::progress_stake(
    Address const &msg_sender, bytes32_t const &message_hash,
    bytes32_t const &unlock_secret)
{
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const stake, load_stake(message_hash));
    BOOST_OUTCOME_TRY(progress_outbox(box_, stake.message, unlock_secret));
    BOOST_OUTCOME_TRY(complete_stake(
        msg_sender, message_hash, stake, false, unlock_secret));

    checkpoint.accept();
    return outcome::success();
}

Result<void> Gateway::progress_stake_with_proof(
    Address const &msg_sender, bytes32_t const &message_hash,
    byte_string_view const proof, uint64_t const block_height,
    MessageStatus const claimed_status)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const stake, load_stake(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    bool const revocation_declared =
        box_.outbox(message_hash) == MessageStatus::DeclaredRevocation;
    BOOST_OUTCOME_TRY(progress_outbox_with_proof(
        box_, stake.message, proof, storage_root, claimed_status));
    BOOST_OUTCOME_TRY(
        complete_stake(msg_sender, message_hash, stake, true, bytes32_t{}));
    if (revocation_declared) {
        // the mint went through first, the revocation penalty is burnt
        send_value(config_.burner, penalty());
    }

    checkpoint.accept();
    return outcome::success();
}

Result<void> Gateway::revert_stake(
    Address const &msg_sender, uint256_t const &msg_value,
    bytes32_t const &message_hash)
{
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const stake, load_stake(message_hash));
    if (TANDEM_UNLIKELY(msg_sender != stake.message.sender)) {
        return GatewayError::OnlyStaker;
    }
    if (TANDEM_UNLIKELY(msg_value != penalty())) {
        return GatewayError::InvalidPenalty;
    }
    BOOST_OUTCOME_TRY(declare_revocation_message(box_, stake.message));
    BOOST_OUTCOME_TRY(receive_value(msg_sender, msg_value));
    emit_revert_stake_intent_declared_event(message_hash, stake);

    checkpoint.accept();
    return outcome::success();
}

// The staker gets the escrowed amount back, bounty and penalty are burnt
Result<void> Gateway::progress_revert_stake(
    Address const &, bytes32_t const &message_hash,
    uint64_t const block_height, byte_string_view const proof)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const stake, load_stake(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    BOOST_OUTCOME_TRY(progress_outbox_revocation(
        box_, stake.message, proof, storage_root, MessageStatus::Revoked));

    BOOST_OUTCOME_TRY(value_token_.transfer(
        ca_, ca_, stake.message.sender, stake.amount.native()));
    send_value(config_.burner, stake.bounty.native() + penalty());
    emit_stake_reverted_event(message_hash, stake);

    checkpoint.accept();
    return outcome::success();
}

/////////////////////////
// Redeem and unstake //
/////////////////////////
Result<bytes32_t> Gateway::confirm_redeem_intent(
    Address const &, Address const &redeemer, uint256_t const &nonce,
    Address const &beneficiary, uint256_t const &amount,
    uint256_t const &gas_price, uint256_t const &gas_limit,
    bytes32_t const &hash_lock, uint64_t const block_height,
    byte_string_view const proof)
{
    uint64_t const initial_gas = state_.gas_used();
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    if (TANDEM_UNLIKELY(amount == 0)) {
        return GatewayError::ZeroAmount;
    }
    if (TANDEM_UNLIKELY(redeemer == Address{})) {
        return GatewayError::ZeroAccount;
    }
    if (TANDEM_UNLIKELY(beneficiary == Address{})) {
        return GatewayError::ZeroBeneficiary;
    }
    if (TANDEM_UNLIKELY(hash_lock == bytes32_t{})) {
        return GatewayError::ZeroHashLock;
    }
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));

    Unstake unstake{
        .amount = amount,
        .beneficiary = beneficiary,
        .message = Message{
            .intent_hash =
                hash_redeem_intent(amount, beneficiary, config_.counterpart),
            .nonce = nonce,
            .gas_price = gas_price,
            .gas_limit = gas_limit,
            .sender = redeemer,
            .hash_lock = hash_lock,
            .gas_consumed = uint256_t{0}}};
    bytes32_t const message_hash = tandem::message_hash(unstake.message);

    BOOST_OUTCOME_TRY(unstakes_.initiate_new_process(
        redeemer, nonce, message_hash, unstake));
    BOOST_OUTCOME_TRY(
        confirm_message(box_, unstake.message, proof, storage_root));

    unstake.message.gas_consumed = state_.gas_used() - initial_gas;
    unstakes_.record(message_hash).store(unstake);
    emit_redeem_intent_confirmed_event(message_hash, unstake, block_height);

    checkpoint.accept();
    return message_hash;
}

Result<void> Gateway::progress_unstake(
    Address const &msg_sender, bytes32_t const &message_hash,
    bytes32_t const &unlock_secret)
{
    uint64_t const initial_gas = state_.gas_used();
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const unstake, load_unstake(message_hash));
    BOOST_OUTCOME_TRY(progress_inbox(box_, unstake.message, unlock_secret));
    BOOST_OUTCOME_TRY(complete_unstake(
        msg_sender, message_hash, unstake, initial_gas, false, unlock_secret));

    checkpoint.accept();
    return outcome::success();
}

Result<void> Gateway::progress_unstake_with_proof(
    Address const &msg_sender, bytes32_t const &message_hash,
    byte_string_view const proof, uint64_t const block_height,
    MessageStatus const claimed_status)
{
    uint64_t const initial_gas = state_.gas_used();
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const unstake, load_unstake(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    BOOST_OUTCOME_TRY(progress_inbox_with_proof(
        box_, unstake.message, proof, storage_root, claimed_status));
    BOOST_OUTCOME_TRY(complete_unstake(
        msg_sender, message_hash, unstake, initial_gas, true, bytes32_t{}));

    checkpoint.accept();
    return outcome::success();
}

Result<RevertedIntent> Gateway::confirm_revert_redeem_intent(
    Address const &, bytes32_t const &message_hash,
    uint64_t const block_height, byte_string_view const proof)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const unstake, load_unstake(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    BOOST_OUTCOME_TRY(
        confirm_revocation(box_, unstake.message, proof, storage_root));
    emit_revert_redeem_intent_confirmed_event(message_hash, unstake);

    checkpoint.accept();
    return RevertedIntent{
        .sender = unstake.message.sender,
        .nonce = unstake.message.nonce.native(),
        .amount = unstake.amount.native()};
}

/////////////
// Linking //
/////////////
Result<bytes32_t> Gateway::initiate_gateway_link(
    Address const &msg_sender, uint256_t const &nonce,
    bytes32_t const &hash_lock)
{
    StateCheckpoint checkpoint{state_};

    if (TANDEM_UNLIKELY(msg_sender != config_.organization)) {
        return GatewayError::OnlyOrganization;
    }
    if (TANDEM_UNLIKELY(vars.linked.load())) {
        return GatewayError::AlreadyLinked;
    }
    if (TANDEM_UNLIKELY(hash_lock == bytes32_t{})) {
        return GatewayError::ZeroHashLock;
    }

    Message const message{
        .intent_hash = hash_link_intent(nonce),
        .nonce = nonce,
        .gas_price = uint256_t{0},
        .gas_limit = uint256_t{0},
        .sender = msg_sender,
        .hash_lock = hash_lock,
        .gas_consumed = uint256_t{0}};
    bytes32_t const message_hash = tandem::message_hash(message);

    BOOST_OUTCOME_TRY(links_.initiate_new_process(
        msg_sender,
        nonce,
        message_hash,
        GatewayLink{.message_hash = message_hash, .message = message}));
    BOOST_OUTCOME_TRY(declare_message(box_, message));
    emit_gateway_link_initiated_event(message_hash);

    LOG_INFO(
        "Gateway {}: initiated link to {} with message {}",
        ca_,
        config_.counterpart,
        message_hash);

    checkpoint.accept();
    return message_hash;
}

Result<void> Gateway::activate_gateway(Address const &msg_sender)
{
    if (TANDEM_UNLIKELY(msg_sender != config_.organization)) {
        return GatewayError::OnlyOrganization;
    }
    if (TANDEM_UNLIKELY(vars.activated.load())) {
        return GatewayError::AlreadyActivated;
    }
    vars.activated.store(true);
    return outcome::success();
}

Result<void> Gateway::deactivate_gateway(Address const &msg_sender)
{
    if (TANDEM_UNLIKELY(msg_sender != config_.organization)) {
        return GatewayError::OnlyOrganization;
    }
    if (TANDEM_UNLIKELY(!vars.activated.load())) {
        return GatewayError::NotActivated;
    }
    vars.activated.store(false);
    return outcome::success();
}

bool Gateway::is_activated()
{
    return vars.activated.load();
}

uint256_t Gateway::get_nonce(Address const &account)
{
    return stakes_.get_nonce(account);
}

uint256_t Gateway::get_link_nonce(Address const &account)
{
    return links_.get_nonce(account);
}

TANDEM_NAMESPACE_END
