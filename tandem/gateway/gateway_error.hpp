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

enum class GatewayError
{
    Success = 0,
    ZeroAmount,
    ZeroBeneficiary,
    ZeroAccount,
    ZeroHashLock,
    InvalidBounty,
    InvalidPenalty,
    InvalidIntentHash,
    OnlyOrganization,
    OnlyStaker,
    OnlyRedeemer,
    NotLinked,
    AlreadyLinked,
    NotActivated,
    AlreadyActivated,
    StateRootNotFound,
    StorageRootNotFound,
    StorageRootMismatch,
    FeeExceedsAmount,
    InsufficientFunds,
    UnknownMessage,
};

TANDEM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tandem::GatewayError>
    : quick_status_code_from_enum_defaults<tandem::GatewayError>
{
    static constexpr auto const domain_name = "Gateway Error";
    static constexpr auto const domain_uuid =
        "6b0d2e94-7a3c-4f15-9c8e-d41f5a2b6e03";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
