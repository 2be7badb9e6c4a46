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

#include <tandem/bus/message_bus_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<tandem::MessageBusError>::mapping> const &
quick_status_code_from_enum<tandem::MessageBusError>::value_mappings()
{
    using tandem::MessageBusError;

    static std::initializer_list<mapping> const v = {
        {MessageBusError::Success, "success", {errc::success}},
        {MessageBusError::ZeroMessageHash,
         "message hash must not be zero",
         {}},
        {MessageBusError::EmptyProof, "rlp parent nodes must not be empty", {}},
        {MessageBusError::ZeroStorageRoot,
         "storage root must not be zero",
         {}},
        {MessageBusError::OutboxNotUndeclared,
         "message on source must be Undeclared",
         {}},
        {MessageBusError::InboxNotUndeclared,
         "message on target must be Undeclared",
         {}},
        {MessageBusError::OutboxNotDeclared,
         "message on source must be Declared",
         {}},
        {MessageBusError::InboxNotDeclared,
         "message on target must be Declared",
         {}},
        {MessageBusError::OutboxNotDeclaredRevocation,
         "message on source must be DeclaredRevocation",
         {}},
        {MessageBusError::InvalidUnlockSecret, "invalid unlock secret", {}},
        {MessageBusError::InvalidClaimedStatus,
         "claimed status of the counterpart is not valid for the transition",
         {}},
        {MessageBusError::MerkleProofVerificationFailed,
         "merkle proof verification failed",
         {}},
        {MessageBusError::InvalidNonce, "invalid nonce", {}},
        {MessageBusError::PreviousProcessNotCompleted,
         "previous process is not completed",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
