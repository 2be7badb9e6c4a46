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
#include <tandem/core/keccak.hpp>
#include <tandem/core/likely.h>
#include <tandem/gateway/constants.hpp>
#include <tandem/gateway/gateway_base.hpp>
#include <tandem/gateway/gateway_error.hpp>
#include <tandem/gateway/intent.hpp>
#include <tandem/proof/proof_verifier.hpp>
#include <tandem/state/abi_encode.hpp>
#include <tandem/state/events.hpp>
#include <tandem/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <limits>

TANDEM_NAMESPACE_BEGIN

GatewayBase::GatewayBase(
    State &state, Address const &ca, GatewayConfig const &config,
    StateRootProvider const &state_root_provider, BoxSide const link_side)
    : state_{state}
    , ca_{ca}
    , config_{config}
    , state_root_provider_{state_root_provider}
    , vars{state, ca_}
    , box_{state, ca_}
    , links_{
          state,
          ca_,
          box_,
          link_side,
          Variables::PrefixLinkRecord,
          Variables::PrefixLinkActiveProcess}
{
}

/////////////
// Events //
/////////////
void GatewayBase::emit_gateway_proven_event(
    uint64_t const block_height, bytes32_t const &storage_root,
    bool const was_already_proved)
{
    constexpr bytes32_t signature{
        0xc8b086273f6873ca5eb46c33fc969bbe291c604753ae831ace47644e4362b2b8_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(abi_encode_address(config_.counterpart))
            .add_data(to_byte_string_view(abi_encode_int(u64_be{block_height})))
            .add_data(to_byte_string_view(storage_root))
            .add_data(to_byte_string_view(abi_encode_bool(was_already_proved)))
            .build();
    state_.store_log(event);
}

void GatewayBase::emit_gateway_link_progressed_event(
    bytes32_t const &message_hash, bytes32_t const &unlock_secret)
{
    constexpr bytes32_t signature{
        0x5872395d52887164c9fcb55e0932236480817345781f4fac72a058e98ddeb6d3_bytes32};
    EventBuilder builder(ca_, signature);
    auto const event =
        builder.add_topic(message_hash)
            .add_topic(abi_encode_address(gateway_address()))
            .add_topic(abi_encode_address(co_gateway_address()))
            .add_data(to_byte_string_view(
                abi_encode_address(config_.value_token)))
            .add_data(to_byte_string_view(abi_encode_bool(false)))
            .add_data(to_byte_string_view(unlock_secret))
            .build();
    state_.store_log(event);
}

/////////////
// Helpers //
/////////////
bytes32_t GatewayBase::hash_link_intent(uint256_t const &nonce) const
{
    return hash_gateway_link_intent(
        gateway_address(),
        co_gateway_address(),
        config_.bounty,
        config_.token_name,
        config_.token_symbol,
        config_.decimals,
        nonce,
        config_.value_token);
}

Result<bytes32_t> GatewayBase::proven_storage_root(uint64_t const block_height)
{
    auto const storage_root = vars.storage_root(block_height).load();
    if (TANDEM_UNLIKELY(storage_root == bytes32_t{})) {
        return GatewayError::StorageRootNotFound;
    }
    return storage_root;
}

Result<void>
GatewayBase::receive_value(Address const &from, uint256_t const &amount)
{
    if (TANDEM_UNLIKELY(state_.get_balance(from) < amount)) {
        return GatewayError::InsufficientFunds;
    }
    state_.subtract_from_balance(from, amount);
    state_.add_to_balance(ca_, amount);
    return outcome::success();
}

void GatewayBase::send_value(Address const &to, uint256_t const &amount)
{
    state_.subtract_from_balance(ca_, amount);
    state_.add_to_balance(to, amount);
}

uint256_t GatewayBase::penalty() const
{
    return config_.bounty * REVOCATION_PENALTY / 100;
}

Result<uint256_t> GatewayBase::fee_of(
    Message const &message, uint64_t const initial_gas,
    uint256_t const &amount) const
{
    uint256_t const gas_limit = message.gas_limit.native();
    uint256_t const gas_price = message.gas_price.native();

    uint256_t gas = message.gas_consumed.native() +
                    (state_.gas_used() - initial_gas);
    if (gas > gas_limit) {
        gas = gas_limit;
    }
    if (TANDEM_UNLIKELY(
            gas_price != 0 &&
            gas > std::numeric_limits<uint256_t>::max() / gas_price)) {
        return GatewayError::FeeExceedsAmount;
    }
    uint256_t const fee = gas * gas_price;
    if (TANDEM_UNLIKELY(fee > amount)) {
        return GatewayError::FeeExceedsAmount;
    }
    return fee;
}

void GatewayBase::charge_calldata(byte_string_view const data)
{
    state_.charge_gas(gas::CALLDATA_BYTE * data.size());
}

Result<void> GatewayBase::require_linked()
{
    if (TANDEM_UNLIKELY(!vars.linked.load())) {
        return GatewayError::NotLinked;
    }
    return outcome::success();
}

////////////////
// Operations //
////////////////
Result<bytes32_t> GatewayBase::prove_gateway(
    uint64_t const block_height, byte_string_view const encoded_account,
    byte_string_view const proof)
{
    StateCheckpoint checkpoint{state_};
    charge_calldata(encoded_account);
    charge_calldata(proof);

    bytes32_t const state_root =
        state_root_provider_.get_state_root(block_height);
    if (TANDEM_UNLIKELY(state_root == bytes32_t{})) {
        return GatewayError::StateRootNotFound;
    }

    bytes32_t const path =
        to_bytes(keccak256(to_byte_string_view(config_.counterpart)));
    BOOST_OUTCOME_TRY(
        auto const storage_root,
        verify_account(encoded_account, proof, path, state_root));

    auto proven = vars.storage_root(block_height);
    auto const existing = proven.load();
    bool const was_already_proved = existing != bytes32_t{};
    if (was_already_proved && TANDEM_UNLIKELY(existing != storage_root)) {
        LOG_ERROR(
            "{} {}: storage root of {} at height {} was proven as {}, "
            "new proof yields {}",
            role(),
            ca_,
            config_.counterpart,
            block_height,
            existing,
            storage_root);
        return GatewayError::StorageRootMismatch;
    }

    if (!was_already_proved) {
        proven.store(storage_root);
        LOG_INFO(
            "{} {}: proven storage root {} of {} at height {}",
            role(),
            ca_,
            storage_root,
            config_.counterpart,
            block_height);
    }
    emit_gateway_proven_event(block_height, storage_root, was_already_proved);

    checkpoint.accept();
    return storage_root;
}

Result<void> GatewayBase::progress_gateway_link(
    Address const &msg_sender, bytes32_t const &message_hash,
    bytes32_t const &unlock_secret)
{
    StateCheckpoint checkpoint{state_};

    if (TANDEM_UNLIKELY(vars.linked.load())) {
        return GatewayError::AlreadyLinked;
    }
    auto const link = links_.record(message_hash).load_checked();
    if (TANDEM_UNLIKELY(!link.has_value())) {
        return GatewayError::UnknownMessage;
    }

    if (links_.side() == BoxSide::Outbox) {
        BOOST_OUTCOME_TRY(progress_outbox(box_, link->message, unlock_secret));
    }
    else {
        BOOST_OUTCOME_TRY(progress_inbox(box_, link->message, unlock_secret));
    }
    vars.linked.store(true);
    emit_gateway_link_progressed_event(message_hash, unlock_secret);

    LOG_INFO(
        "{} {}: linked {} and {}, progressed by {}",
        role(),
        ca_,
        gateway_address(),
        co_gateway_address(),
        msg_sender);

    checkpoint.accept();
    return outcome::success();
}

MessageStatus GatewayBase::get_outbox_status(bytes32_t const &message_hash)
{
    return box_.outbox(message_hash);
}

MessageStatus GatewayBase::get_inbox_status(bytes32_t const &message_hash)
{
    return box_.inbox(message_hash);
}

bytes32_t GatewayBase::get_storage_root(uint64_t const block_height)
{
    return vars.storage_root(block_height).load();
}

bool GatewayBase::is_linked()
{
    return vars.linked.load();
}

TANDEM_NAMESPACE_END
