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

#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/core/likely.h>
#include <tandem/mpt/nibbles_view.hpp>
#include <tandem/mpt/proof.hpp>
#include <tandem/proof/proof_verifier.hpp>
#include <tandem/rlp/decode.hpp>
#include <tandem/rlp/decode_error.hpp>
#include <tandem/state/account_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

TANDEM_NAMESPACE_BEGIN

Result<bytes32_t> verify_account(
    byte_string_view const encoded_account, byte_string_view const parent_nodes,
    bytes32_t const &path, bytes32_t const &state_root)
{
    BOOST_OUTCOME_TRY(
        auto const leaf,
        mpt::verify_proof(
            mpt::NibblesView{to_byte_string_view(path)},
            state_root,
            parent_nodes));
    if (TANDEM_UNLIKELY(leaf != encoded_account)) {
        return mpt::ProofError::WrongMerkleProof;
    }
    byte_string_view enc{leaf};
    BOOST_OUTCOME_TRY(auto const account, rlp::decode_account(enc));
    return account.storage_root;
}

Result<bytes32_t> verify_storage(
    bytes32_t const &slot, byte_string_view const parent_nodes,
    bytes32_t const &storage_root)
{
    bytes32_t const key = to_bytes(keccak256(to_byte_string_view(slot)));
    BOOST_OUTCOME_TRY(
        auto const leaf,
        mpt::verify_proof(
            mpt::NibblesView{to_byte_string_view(key)},
            storage_root,
            parent_nodes));
    byte_string_view enc{leaf};
    BOOST_OUTCOME_TRY(auto const value, rlp::decode_unsigned<uint256_t>(enc));
    if (TANDEM_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return intx::be::store<bytes32_t>(value);
}

TANDEM_NAMESPACE_END
