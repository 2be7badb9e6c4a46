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

#include <tandem/gateway/gateway_error.hpp>

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
    quick_status_code_from_enum<tandem::GatewayError>::mapping> const &
quick_status_code_from_enum<tandem::GatewayError>::value_mappings()
{
    using tandem::GatewayError;

    static std::initializer_list<mapping> const v = {
        {GatewayError::Success, "success", {errc::success}},
        {GatewayError::ZeroAmount, "amount must not be zero", {}},
        {GatewayError::ZeroBeneficiary,
         "beneficiary address must not be zero",
         {}},
        {GatewayError::ZeroAccount, "account address must not be zero", {}},
        {GatewayError::ZeroHashLock, "hash lock must not be zero", {}},
        {GatewayError::InvalidBounty, "value must match the bounty", {}},
        {GatewayError::InvalidPenalty, "value must match the penalty", {}},
        {GatewayError::InvalidIntentHash,
         "intent hash does not match the gateway link parameters",
         {}},
        {GatewayError::OnlyOrganization,
         "only the organization can call the function",
         {}},
        {GatewayError::OnlyStaker, "only the staker can revert the stake", {}},
        {GatewayError::OnlyRedeemer,
         "only the redeemer can revert the redemption",
         {}},
        {GatewayError::NotLinked, "gateway is not linked", {}},
        {GatewayError::AlreadyLinked, "gateway is already linked", {}},
        {GatewayError::NotActivated, "gateway is not activated", {}},
        {GatewayError::AlreadyActivated, "gateway is already activated", {}},
        {GatewayError::StateRootNotFound,
         "state root of the block height is not anchored",
         {}},
        {GatewayError::StorageRootNotFound,
         "storage root of the block height is not proven",
         {}},
        {GatewayError::StorageRootMismatch,
         "proven storage root differs from the stored one",
         {}},
        {GatewayError::FeeExceedsAmount, "fee exceeds the amount", {}},
        {GatewayError::InsufficientFunds, "insufficient base funds", {}},
        {GatewayError::UnknownMessage, "no record for the message hash", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
