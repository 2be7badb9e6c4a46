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

#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/result.hpp>
#include <tandem/mpt/config.hpp>
#include <tandem/mpt/nibbles_view.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

TANDEM_MPT_NAMESPACE_BEGIN

enum class ProofError
{
    Success = 0,
    InvalidKey,
    WrongMerkleProof,
    UnexpectedType,
    EmptyProof,
    TooManyNodes,
};

// Walks an rlp list of trie nodes, ordered from the root towards the leaf, and
// returns the value stored under `key`. Inline nodes (encoded in fewer than 32
// bytes) are expected as their own entries in the list.
Result<byte_string>
verify_proof(NibblesView key, bytes32_t const &merkle_root, byte_string_view);

TANDEM_MPT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tandem::mpt::ProofError>
    : quick_status_code_from_enum_defaults<tandem::mpt::ProofError>
{
    static constexpr auto const domain_name = "Proof Error";
    static constexpr auto const domain_uuid =
        "c4e1b8f2-5d37-4a96-a0e3-6f2b9d84c175";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
