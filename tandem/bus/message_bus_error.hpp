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

#include <tandem/core/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

TANDEM_NAMESPACE_BEGIN

enum class MessageBusError
{
    Success = 0,
    ZeroMessageHash,
    EmptyProof,
    ZeroStorageRoot,
    OutboxNotUndeclared,
    InboxNotUndeclared,
    OutboxNotDeclared,
    InboxNotDeclared,
    OutboxNotDeclaredRevocation,
    InvalidUnlockSecret,
    InvalidClaimedStatus,
    MerkleProofVerificationFailed,
    InvalidNonce,
    PreviousProcessNotCompleted,
};

TANDEM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tandem::MessageBusError>
    : quick_status_code_from_enum_defaults<tandem::MessageBusError>
{
    static constexpr auto const domain_name = "Message Bus Error";
    static constexpr auto const domain_uuid =
        "9d3e7b52-0c41-4a8f-b6d9-18e2f5a7c630";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
