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
#include <tandem/bus/message_box.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/result.hpp>

TANDEM_NAMESPACE_BEGIN

// State machine over the message box of one endpoint:
//
//   Undeclared -> Declared -> Progressed
//                 Declared -> DeclaredRevocation -> Revoked   (outbox)
//                             DeclaredRevocation -> Progressed (outbox)
//                 Declared -> Revoked                         (inbox)
//
// Proof taking transitions check the status of the counterpart endpoint with a
// storage proof against `storage_root`, the proven storage root of the
// counterpart contract. Every transition validates all of its inputs before
// it writes, so a failed call leaves the box untouched. All return the hash
// of the message.

Result<bytes32_t> declare_message(MessageBox &, Message const &);

// Inbox Undeclared -> Declared, if the counterpart outbox is Declared
Result<bytes32_t> confirm_message(
    MessageBox &, Message const &, byte_string_view proof,
    bytes32_t const &storage_root);

Result<bytes32_t> progress_outbox(
    MessageBox &, Message const &, bytes32_t const &unlock_secret);

Result<bytes32_t> progress_inbox(
    MessageBox &, Message const &, bytes32_t const &unlock_secret);

// Outbox Declared -> Progressed, if the counterpart inbox is `claimed_status`,
// one of Declared or Progressed. An outbox in DeclaredRevocation progresses
// only against an inbox proven Progressed.
Result<bytes32_t> progress_outbox_with_proof(
    MessageBox &, Message const &, byte_string_view proof,
    bytes32_t const &storage_root, MessageStatus claimed_status);

// Inbox Declared -> Progressed, if the counterpart outbox is `claimed_status`,
// one of Declared or Progressed
Result<bytes32_t> progress_inbox_with_proof(
    MessageBox &, Message const &, byte_string_view proof,
    bytes32_t const &storage_root, MessageStatus claimed_status);

// Outbox Declared -> DeclaredRevocation
Result<bytes32_t> declare_revocation_message(MessageBox &, Message const &);

// Inbox Declared -> Revoked, if the counterpart outbox is DeclaredRevocation
Result<bytes32_t> confirm_revocation(
    MessageBox &, Message const &, byte_string_view proof,
    bytes32_t const &storage_root);

// Outbox DeclaredRevocation -> Revoked, if the counterpart inbox is
// `claimed_status`, one of DeclaredRevocation or Revoked
Result<bytes32_t> progress_outbox_revocation(
    MessageBox &, Message const &, byte_string_view proof,
    bytes32_t const &storage_root, MessageStatus claimed_status);

TANDEM_NAMESPACE_END
