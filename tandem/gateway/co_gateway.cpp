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
#include <tandem/gateway/co_gateway.hpp>
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

CoGateway::CoGateway(
    State &state, Address const &ca, GatewayConfig const &config,
    StateRootProvider const &state_root_provider, UtilityToken &utility_token)
    : GatewayBase{state, ca, config, state_root_provider, BoxSide::Inbox}
    , utility_token_{utility_token}
    , redeems_{
          state,
          ca_,
          box_,
          BoxSide::Outbox,
          Variables::PrefixOutboxRecord,
          Variables::PrefixOutboxActiveProcess}
    , mints_{
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
void CoGateway::emit_stake_intent_confirmed_event(
    bytes32_t const &message_hash, Mint const &mint,
    uint64_t const block_height)
{
    constexpr bytes32_t signature{
        0x09c429eb0c6ace051a7e464a0add3664c55a8482b93816fdcbdf92f5d7ceb81e_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(mint.message.sender))
            .add_data(to_byte_string_view(abi_encode_int(mint.message.nonce)))
            .add_data(
                to_byte_string_view(abi_encode_address(mint.beneficiary)))
            .add_data(to_byte_string_view(abi_encode_int(mint.amount)))
            .add_data(to_byte_string_view(abi_encode_int(u64_be{block_height})))
            .add_data(to_byte_string_view(mint.message.hash_lock))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_mint_progressed_event(
    bytes32_t const &message_hash, Mint const &mint,
    uint256_t const &minted_amount, uint256_t const &reward_amount,
    bool const proof_progress, bytes32_t const &unlock_secret)
{
    constexpr bytes32_t signature{
        0xbf81e8c456a7484e025395ab4e1492b688012d0f5256401f71d9d0a16b5d68d3_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(mint.message.sender))
            .add_topic(abi_encode_address(mint.beneficiary))
            .add_data(to_byte_string_view(abi_encode_int(mint.amount)))
            .add_data(to_byte_string_view(abi_encode_int(u256_be{minted_amount})))
            .add_data(to_byte_string_view(abi_encode_int(u256_be{reward_amount})))
            .add_data(to_byte_string_view(abi_encode_bool(proof_progress)))
            .add_data(to_byte_string_view(unlock_secret))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_revert_stake_intent_confirmed_event(
    bytes32_t const &message_hash, Mint const &mint)
{
    constexpr bytes32_t signature{
        0xa7b12d2cec2594d7704b4b4f947ef0c1fae37f5f4aeddbeccb980505b383171f_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(mint.message.sender))
            .add_data(to_byte_string_view(abi_encode_int(mint.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(mint.amount)))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_redeem_intent_declared_event(
    bytes32_t const &message_hash, Redeem const &redeem)
{
    constexpr bytes32_t signature{
        0xdd1352ae291d8132beec7e4442e4d982729cd2b7aade23ce1810bf36ccfa8559_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(redeem.message.sender))
            .add_data(
                to_byte_string_view(abi_encode_int(redeem.message.nonce)))
            .add_data(
                to_byte_string_view(abi_encode_address(redeem.beneficiary)))
            .add_data(to_byte_string_view(abi_encode_int(redeem.amount)))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_redeem_progressed_event(
    bytes32_t const &message_hash, Redeem const &redeem,
    bool const proof_progress, bytes32_t const &unlock_secret)
{
    constexpr bytes32_t signature{
        0xc8a2b315f4d996ac017ddcd7121d5223ecdc6708a97a76c628b391fa0529454e_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(redeem.message.sender))
            .add_data(
                to_byte_string_view(abi_encode_int(redeem.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(redeem.amount)))
            .add_data(to_byte_string_view(abi_encode_bool(proof_progress)))
            .add_data(to_byte_string_view(unlock_secret))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_revert_redeem_declared_event(
    bytes32_t const &message_hash, Redeem const &redeem)
{
    constexpr bytes32_t signature{
        0xeef4349a219b2fc35d071d8fd1b99b01f97f25d9f8338abb5e1f5fb11caef0c7_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(redeem.message.sender))
            .add_data(
                to_byte_string_view(abi_encode_int(redeem.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(redeem.amount)))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_redeem_reverted_event(
    bytes32_t const &message_hash, Redeem const &redeem)
{
    constexpr bytes32_t signature{
        0x15322f88c2092febcece880691350cadb45196819c8604460adf4b0dcc426387_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(redeem.message.sender))
            .add_data(
                to_byte_string_view(abi_encode_int(redeem.message.nonce)))
            .add_data(to_byte_string_view(abi_encode_int(redeem.amount)))
            .build();
    state_.store_log(event);
}

void CoGateway::emit_gateway_link_confirmed_event(
    bytes32_t const &message_hash)
{
    constexpr bytes32_t signature{
        0x01a6d39eb9084ee4503837da43f8e7489710d4d37378a51611556769b5594203_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event = builder.add_topic(message_hash)
                           .add_topic(abi_encode_address(config_.counterpart))
                           .add_topic(abi_encode_address(ca_))
                           .add_data(to_byte_string_view(
                               abi_encode_address(config_.value_token)))
                           .build();
    state_.store_log(event);
}

/////////////
// Helpers //
/////////////
Result<Mint> CoGateway::load_mint(bytes32_t const &message_hash)
{
    auto const mint = mints_.record(message_hash).load_checked();
    if (TANDEM_UNLIKELY(!mint.has_value())) {
        return GatewayError::UnknownMessage;
    }
    return mint.value();
}

Result<Redeem> CoGateway::load_redeem(bytes32_t const &message_hash)
{
    auto const redeem = redeems_.record(message_hash).load_checked();
    if (TANDEM_UNLIKELY(!redeem.has_value())) {
        return GatewayError::UnknownMessage;
    }
    return redeem.value();
}

// The beneficiary receives the amount less the fee, which goes to the
// facilitator
Result<void> CoGateway::complete_mint(
    Address const &msg_sender, bytes32_t const &message_hash,
    Mint const &mint, uint64_t const initial_gas, bool const proof_progress,
    bytes32_t const &unlock_secret)
{
    uint256_t const amount = mint.amount.native();
    BOOST_OUTCOME_TRY(
        auto const fee, fee_of(mint.message, initial_gas, amount));
    uint256_t const minted_amount = amount - fee;

    if (minted_amount != 0) {
        BOOST_OUTCOME_TRY(
            utility_token_.mint(ca_, mint.beneficiary, minted_amount));
    }
    if (fee != 0) {
        BOOST_OUTCOME_TRY(utility_token_.mint(ca_, msg_sender, fee));
    }
    emit_mint_progressed_event(
        message_hash, mint, minted_amount, fee, proof_progress, unlock_secret);
    return outcome::success();
}

// Escrowed tokens are burnt, the bounty goes to the facilitator
Result<void> CoGateway::complete_redeem(
    Address const &msg_sender, bytes32_t const &message_hash,
    Redeem const &redeem, bool const proof_progress,
    bytes32_t const &unlock_secret)
{
    BOOST_OUTCOME_TRY(utility_token_.burn(ca_, ca_, redeem.amount.native()));
    send_value(msg_sender, redeem.bounty.native());
    emit_redeem_progressed_event(
        message_hash, redeem, proof_progress, unlock_secret);
    return outcome::success();
}

////////////////////
// Stake and mint //
////////////////////
Result<bytes32_t> CoGateway::confirm_stake_intent(
    Address const &, Address const &staker, uint256_t const &nonce,
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
    if (TANDEM_UNLIKELY(staker == Address{})) {
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

    Mint mint{
        .amount = amount,
        .beneficiary = beneficiary,
        .message = Message{
            .intent_hash =
                hash_stake_intent(amount, beneficiary, config_.counterpart),
            .nonce = nonce,
            .gas_price = gas_price,
            .gas_limit = gas_limit,
            .sender = staker,
            .hash_lock = hash_lock,
            .gas_consumed = uint256_t{0}}};
    bytes32_t const message_hash = tandem::message_hash(mint.message);

    BOOST_OUTCOME_TRY(
        mints_.initiate_new_process(staker, nonce, message_hash, mint));
    BOOST_OUTCOME_TRY(confirm_message(box_, mint.message, proof, storage_root));

    mint.message.gas_consumed = state_.gas_used() - initial_gas;
    mints_.record(message_hash).store(mint);
    emit_stake_intent_confirmed_event(message_hash, mint, block_height);

    checkpoint.accept();
    return message_hash;
}

Result<void> CoGateway::progress_mint(
    Address const &msg_sender, bytes32_t const &message_hash,
    bytes32_t const &unlock_secret)
{
    uint64_t const initial_gas = state_.gas_used();
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const mint, load_mint(message_hash));
    BOOST_OUTCOME_TRY(progress_inbox(box_, mint.message, unlock_secret));
    BOOST_OUTCOME_TRY(complete_mint(
        msg_sender, message_hash, mint, initial_gas, false, unlock_secret));

    checkpoint.accept();
    return outcome::success();
}

Result<void> CoGateway::progress_mint_with_proof(
    Address const &msg_sender, bytes32_t const &message_hash,
    byte_string_view const proof, uint64_t const block_height,
    MessageStatus const claimed_status)
{
    uint64_t const initial_gas = state_.gas_used();
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const mint, load_mint(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    BOOST_OUTCOME_TRY(progress_inbox_with_proof(
        box_, mint.message, proof, storage_root, claimed_status));
    BOOST_OUTCOME_TRY(complete_mint(
        msg_sender, message_hash, mint, initial_gas, true, bytes32_t{}));

    checkpoint.accept();
    return outcome::success();
}

Result<RevertedIntent> CoGateway::confirm_revert_stake_intent(
    Address const &, bytes32_t const &message_hash,
    uint64_t const block_height, byte_string_view const proof)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const mint, load_mint(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    BOOST_OUTCOME_TRY(
        confirm_revocation(box_, mint.message, proof, storage_root));
    emit_revert_stake_intent_confirmed_event(message_hash, mint);

    checkpoint.accept();
    return RevertedIntent{
        .sender = mint.message.sender,
        .nonce = mint.message.nonce.native(),
        .amount = mint.amount.native()};
}

/////////////////////////
// Redeem and unstake //
/////////////////////////
Result<bytes32_t> CoGateway::redeem(
    Address const &msg_sender, uint256_t const &msg_value,
    uint256_t const &amount, Address const &beneficiary,
    uint256_t const &gas_price, uint256_t const &gas_limit,
    uint256_t const &nonce, bytes32_t const &hash_lock)
{
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(require_linked());
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

    Redeem const redeem{
        .amount = amount,
        .beneficiary = beneficiary,
        .facilitator = msg_sender,
        .bounty = config_.bounty,
        .message = Message{
            .intent_hash = hash_redeem_intent(amount, beneficiary, ca_),
            .nonce = nonce,
            .gas_price = gas_price,
            .gas_limit = gas_limit,
            .sender = msg_sender,
            .hash_lock = hash_lock,
            .gas_consumed = uint256_t{0}}};
    bytes32_t const message_hash = tandem::message_hash(redeem.message);

    BOOST_OUTCOME_TRY(redeems_.initiate_new_process(
        msg_sender, nonce, message_hash, redeem));
    BOOST_OUTCOME_TRY(utility_token_.transfer(ca_, msg_sender, ca_, amount));
    BOOST_OUTCOME_TRY(receive_value(msg_sender, msg_value));
    BOOST_OUTCOME_TRY(declare_message(box_, redeem.message));
    emit_redeem_intent_declared_event(message_hash, redeem);

    checkpoint.accept();
    return message_hash;
}

Result<void> CoGateway::progress_redeem(
    Address const &msg_sender, bytes32_t const &message_hash,
    bytes32_t const &unlock_secret)
{
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const redeem, load_redeem(message_hash));
    BOOST_OUTCOME_TRY(progress_outbox(box_, redeem.message, unlock_secret));
    BOOST_OUTCOME_TRY(complete_redeem(
        msg_sender, message_hash, redeem, false, unlock_secret));

    checkpoint.accept();
    return outcome::success();
}

Result<void> CoGateway::progress_redeem_with_proof(
    Address const &msg_sender, bytes32_t const &message_hash,
    byte_string_view const proof, uint64_t const block_height,
    MessageStatus const claimed_status)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const redeem, load_redeem(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    bool const revocation_declared =
        box_.outbox(message_hash) == MessageStatus::DeclaredRevocation;
    BOOST_OUTCOME_TRY(progress_outbox_with_proof(
        box_, redeem.message, proof, storage_root, claimed_status));
    BOOST_OUTCOME_TRY(complete_redeem(
        msg_sender, message_hash, redeem, true, bytes32_t{}));
    if (revocation_declared) {
        send_value(config_.burner, penalty());
    }

    checkpoint.accept();
    return outcome::success();
}

Result<void> CoGateway::revert_redemption(
    Address const &msg_sender, uint256_t const &msg_value,
    bytes32_t const &message_hash)
{
    StateCheckpoint checkpoint{state_};

    BOOST_OUTCOME_TRY(auto const redeem, load_redeem(message_hash));
    if (TANDEM_UNLIKELY(msg_sender != redeem.message.sender)) {
        return GatewayError::OnlyRedeemer;
    }
    if (TANDEM_UNLIKELY(msg_value != penalty())) {
        return GatewayError::InvalidPenalty;
    }
    BOOST_OUTCOME_TRY(declare_revocation_message(box_, redeem.message));
    BOOST_OUTCOME_TRY(receive_value(msg_sender, msg_value));
    emit_revert_redeem_declared_event(message_hash, redeem);

    checkpoint.accept();
    return outcome::success();
}

// The redeemer gets the escrowed tokens back, bounty and penalty are burnt
Result<void> CoGateway::progress_revert_redemption(
    Address const &, bytes32_t const &message_hash,
    uint64_t const block_height, byte_string_view const proof)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    BOOST_OUTCOME_TRY(auto const redeem, load_redeem(message_hash));
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));
    BOOST_OUTCOME_TRY(progress_outbox_revocation(
        box_, redeem.message, proof, storage_root, MessageStatus::Revoked));

    BOOST_OUTCOME_TRY(utility_token_.transfer(
        ca_, ca_, redeem.message.sender, redeem.amount.native()));
    send_value(config_.burner, redeem.bounty.native() + penalty());
    emit_redeem_reverted_event(message_hash, redeem);

    checkpoint.accept();
    return outcome::success();
}

/////////////
// Linking //
/////////////
Result<bytes32_t> CoGateway::confirm_gateway_link_intent(
    Address const &, bytes32_t const &intent_hash, uint256_t const &nonce,
    Address const &sender, bytes32_t const &hash_lock,
    uint64_t const block_height, byte_string_view const proof)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(proof);

    if (TANDEM_UNLIKELY(vars.linked.load())) {
        return GatewayError::AlreadyLinked;
    }
    if (TANDEM_UNLIKELY(sender == Address{})) {
        return GatewayError::ZeroAccount;
    }
    if (TANDEM_UNLIKELY(hash_lock == bytes32_t{})) {
        return GatewayError::ZeroHashLock;
    }
    if (TANDEM_UNLIKELY(intent_hash != hash_link_intent(nonce))) {
        return GatewayError::InvalidIntentHash;
    }
    BOOST_OUTCOME_TRY(
        auto const storage_root, proven_storage_root(block_height));

    Message const message{
        .intent_hash = intent_hash,
        .nonce = nonce,
        .gas_price = uint256_t{0},
        .gas_limit = uint256_t{0},
        .sender = sender,
        .hash_lock = hash_lock,
        .gas_consumed = uint256_t{0}};
    bytes32_t const message_hash = tandem::message_hash(message);

    BOOST_OUTCOME_TRY(links_.initiate_new_process(
        sender,
        nonce,
        message_hash,
        GatewayLink{.message_hash = message_hash, .message = message}));
    BOOST_OUTCOME_TRY(confirm_message(box_, message, proof, storage_root));
    emit_gateway_link_confirmed_event(message_hash);

    LOG_INFO(
        "CoGateway {}: confirmed link from {} with message {}",
        ca_,
        config_.counterpart,
        message_hash);

    checkpoint.accept();
    return message_hash;
}

uint256_t CoGateway::get_nonce(Address const &account)
{
    return redeems_.get_nonce(account);
}

TANDEM_NAMESPACE_END
