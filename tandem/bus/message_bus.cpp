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

#include <tandem/bus/message.hpp>
#include <tandem/bus/message_box.hpp>
#include <tandem/bus/message_bus.hpp>
#include <tandem/bus/message_bus_error.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/likely.h>
#include <tandem/proof/proof_verifier.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

TANDEM_ANONYMOUS_NAMESPACE_BEGIN

Result<bytes32_t> hash_of(Message const &message)
{
    auto const hash = message_hash(message);
    if (TANDEM_UNLIKELY(hash == bytes32_t{})) {
        return MessageBusError::ZeroMessageHash;
    }
    return hash;
}

Result<void> check_proof_inputs(
    byte_string_view const proof, bytes32_t const &storage_root)
{
    if (TANDEM_UNLIKELY(proof.empty())) {
        return MessageBusError::EmptyProof;
    }
    if (TANDEM_UNLIKELY(storage_root == bytes32_t{})) {
        return MessageBusError::ZeroStorageRoot;
    }
    return outcome::success();
}

Result<void> require_status(
    MessageBox &box, BoxSide const side, bytes32_t const &hash,
    MessageStatus const expected, MessageBusError const error)
{
    if (TANDEM_UNLIKELY(box.status(side, hash) != expected)) {
        return error;
    }
    return outcome::success();
}

// The counterpart keeps its boxes at the same slots as this endpoint
Result<void> verify_counterpart_status(
    BoxSide const side, bytes32_t const &hash, MessageStatus const expected,
    byte_string_view const proof, bytes32_t const &storage_root)
{
    BOOST_OUTCOME_TRY(
        auto const value,
        verify_storage(MessageBox::slot(side, hash), proof, storage_root));
    if (TANDEM_UNLIKELY(value != to_status_word(expected))) {
        return MessageBusError::MerkleProofVerificationFailed;
    }
    return outcome::success();
}

Result<bytes32_t> progress_with_secret(
    MessageBox &box, BoxSide const side, Message const &message,
    bytes32_t const &unlock_secret)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(require_status(
        box,
        side,
        hash,
        MessageStatus::Declared,
        side == BoxSide::Outbox ? MessageBusError::OutboxNotDeclared
                                : MessageBusError::InboxNotDeclared));
    if (TANDEM_UNLIKELY(to_hash_lock(unlock_secret) != message.hash_lock)) {
        return MessageBusError::InvalidUnlockSecret;
    }
    box.set_status(side, hash, MessageStatus::Progressed);
    return hash;
}

Result<bytes32_t> progress_with_proof(
    MessageBox &box, BoxSide const side, Message const &message,
    byte_string_view const proof, bytes32_t const &storage_root,
    MessageStatus const claimed_status)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(check_proof_inputs(proof, storage_root));
    if (TANDEM_UNLIKELY(
            claimed_status != MessageStatus::Declared &&
            claimed_status != MessageStatus::Progressed)) {
        return MessageBusError::InvalidClaimedStatus;
    }
    // An outbox whose revocation lost the race against the counterpart
    // progressing its inbox completes as well
    MessageStatus const status = box.status(side, hash);
    bool const progressed_over_revocation =
        side == BoxSide::Outbox &&
        status == MessageStatus::DeclaredRevocation &&
        claimed_status == MessageStatus::Progressed;
    if (TANDEM_UNLIKELY(
            status != MessageStatus::Declared &&
            !progressed_over_revocation)) {
        return side == BoxSide::Outbox ? MessageBusError::OutboxNotDeclared
                                       : MessageBusError::InboxNotDeclared;
    }
    BoxSide const counterpart =
        side == BoxSide::Outbox ? BoxSide::Inbox : BoxSide::Outbox;
    BOOST_OUTCOME_TRY(verify_counterpart_status(
        counterpart, hash, claimed_status, proof, storage_root));
    box.set_status(side, hash, MessageStatus::Progressed);
    return hash;
}

TANDEM_ANONYMOUS_NAMESPACE_END

TANDEM_NAMESPACE_BEGIN

Result<bytes32_t> declare_message(MessageBox &box, Message const &message)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(require_status(
        box,
        BoxSide::Outbox,
        hash,
        MessageStatus::Undeclared,
        MessageBusError::OutboxNotUndeclared));
    box.set_status(BoxSide::Outbox, hash, MessageStatus::Declared);
    return hash;
}

Result<bytes32_t> confirm_message(
    MessageBox &box, Message const &message, byte_string_view const proof,
    bytes32_t const &storage_root)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(check_proof_inputs(proof, storage_root));
    BOOST_OUTCOME_TRY(require_status(
        box,
        BoxSide::Inbox,
        hash,
        MessageStatus::Undeclared,
        MessageBusError::InboxNotUndeclared));
    BOOST_OUTCOME_TRY(verify_counterpart_status(
        BoxSide::Outbox, hash, MessageStatus::Declared, proof, storage_root));
    box.set_status(BoxSide::Inbox, hash, MessageStatus::Declared);
    return hash;
}

Result<bytes32_t> progress_outbox(
    MessageBox &box, Message const &message, bytes32_t const &unlock_secret)
{
    return progress_with_secret(box, BoxSide::Outbox, message, unlock_secret);
}

Result<bytes32_t> progress_inbox(
    MessageBox &box, Message const &message, bytes32_t const &unlock_secret)
{
    return progress_with_secret(box, BoxSide::Inbox, message, unlock_secret);
}

Result<bytes32_t> progress_outbox_with_proof(
    MessageBox &box, Message const &message, byte_string_view const proof,
    bytes32_t const &storage_root, MessageStatus const claimed_status)
{
    return progress_with_proof(
        box, BoxSide::Outbox, message, proof, storage_root, claimed_status);
}

Result<bytes32_t> progress_inbox_with_proof(
    MessageBox &box, Message const &message, byte_string_view const proof,
    bytes32_t const &storage_root, MessageStatus const claimed_status)
{
    return progress_with_proof(
        box, BoxSide::Inbox, message, proof, storage_root, claimed_status);
}

Result<bytes32_t>
declare_revocation_message(MessageBox &box, Message const &message)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(require_status(
        box,
        BoxSide::Outbox,
        hash,
        MessageStatus::Declared,
        MessageBusError::OutboxNotDeclared));
    box.set_status(BoxSide::Outbox, hash, MessageStatus::DeclaredRevocation);
    return hash;
}

Result<bytes32_t> confirm_revocation(
    MessageBox &box, Message const &message, byte_string_view const proof,
    bytes32_t const &storage_root)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(check_proof_inputs(proof, storage_root));
    BOOST_OUTCOME_TRY(require_status(
        box,
        BoxSide::Inbox,
        hash,
        MessageStatus::Declared,
        MessageBusError::InboxNotDeclared));
    BOOST_OUTCOME_TRY(verify_counterpart_status(
        BoxSide::Outbox,
        hash,
        MessageStatus::DeclaredRevocation,
        proof,
        storage_root));
    box.set_status(BoxSide::Inbox, hash, MessageStatus::Revoked);
    return hash;
}

Result<bytes32_t> progress_outbox_revocation(
    MessageBox &box, Message const &message, byte_string_view const proof,
    bytes32_t const &storage_root, MessageStatus const claimed_status)
{
    BOOST_OUTCOME_TRY(auto const hash, hash_of(message));
    BOOST_OUTCOME_TRY(check_proof_inputs(proof, storage_root));
    BOOST_OUTCOME_TRY(require_status(
        box,
        BoxSide::Outbox,
        hash,
        MessageStatus::DeclaredRevocation,
        MessageBusError::OutboxNotDeclaredRevocation));
    if (TANDEM_UNLIKELY(
            claimed_status != MessageStatus::DeclaredRevocation &&
            claimed_status != MessageStatus::Revoked)) {
        return MessageBusError::InvalidClaimedStatus;
    }
    BOOST_OUTCOME_TRY(verify_counterpart_status(
        BoxSide::Inbox, hash, claimed_status, proof, storage_root));
    box.set_status(BoxSide::Outbox, hash, MessageStatus::Revoked);
    return hash;
}

TANDEM_NAMESPACE_END
