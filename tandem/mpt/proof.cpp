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
#include <tandem/core/keccak.hpp>
#include <tandem/core/likely.h>
#include <tandem/mpt/node.hpp>
#include <tandem/mpt/proof.hpp>
#include <tandem/rlp/encode.hpp>
#include <tandem/rlp/item.hpp>

#include <boost/outcome/try.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <utility>

TANDEM_MPT_NAMESPACE_BEGIN

using rlp::RawItem;

namespace
{
    Result<RawNode const *> to_node(RawItem const &item)
    {
        if (auto const *const node = std::get_if<RawList>(&item.value);
            TANDEM_LIKELY(node != nullptr)) {
            return node;
        }
        return ProofError::UnexpectedType;
    }

    byte_string to_node_reference(byte_string_view const encoded)
    {
        if (encoded.size() < KECCAK256_SIZE) {
            return byte_string{encoded};
        }
        return byte_string{to_byte_string_view(to_bytes(keccak256(encoded)))};
    }

    // A child is either the hash of its encoding or, when shorter than a hash,
    // the node itself
    Result<byte_string> to_child_reference(RawItem const &child)
    {
        if (auto const *const hash = std::get_if<RawString>(&child.value)) {
            if (TANDEM_UNLIKELY(hash->size() != KECCAK256_SIZE)) {
                return ProofError::UnexpectedType;
            }
            return *hash;
        }
        auto encoded = rlp::encode_item(child);
        if (TANDEM_UNLIKELY(encoded.size() >= KECCAK256_SIZE)) {
            return ProofError::UnexpectedType;
        }
        return encoded;
    }

    bool is_empty_child(RawItem const &child)
    {
        auto const *const str = std::get_if<RawString>(&child.value);
        return str != nullptr && str->empty();
    }
}

Result<byte_string> verify_proof(
    NibblesView const key, bytes32_t const &merkle_root,
    byte_string_view const encoded_proof)
{
    BOOST_OUTCOME_TRY(auto const decoded, rlp::decode_item(encoded_proof));
    auto const *const proof = std::get_if<RawList>(&decoded.value);
    if (TANDEM_UNLIKELY(proof == nullptr)) {
        return ProofError::UnexpectedType;
    }
    if (TANDEM_UNLIKELY(proof->empty())) {
        return ProofError::EmptyProof;
    }
    if (TANDEM_UNLIKELY(proof->size() > MAX_PROOF_NODES)) {
        return ProofError::TooManyNodes;
    }

    byte_string expected_reference;
    size_t consumed = 0;

    for (size_t i = 0; i < proof->size(); ++i) {
        RawItem const &item = (*proof)[i];
        bool const is_last = i + 1 == proof->size();

        // the root is always referenced by hash, whatever its size
        auto const encoded = rlp::encode_item(item);
        if (i == 0) {
            if (TANDEM_UNLIKELY(to_bytes(keccak256(encoded)) != merkle_root)) {
                return ProofError::WrongMerkleProof;
            }
        }
        else if (TANDEM_UNLIKELY(
                     to_node_reference(encoded) != expected_reference)) {
            return ProofError::WrongMerkleProof;
        }

        BOOST_OUTCOME_TRY(auto const *const node, to_node(item));
        NibblesView const remaining = key.substr(consumed);

        if (is_branch_node(*node)) {
            if (remaining.empty()) {
                RawItem const &value = (*node)[BRANCH_NODE_SIZE - 1];
                if (is_empty_child(value)) {
                    return ProofError::InvalidKey;
                }
                if (TANDEM_UNLIKELY(!is_last)) {
                    return ProofError::WrongMerkleProof;
                }
                auto const *const str = std::get_if<RawString>(&value.value);
                if (TANDEM_UNLIKELY(str == nullptr)) {
                    return ProofError::UnexpectedType;
                }
                return *str;
            }
            RawItem const &child = (*node)[remaining.get(0)];
            if (is_empty_child(child)) {
                return ProofError::InvalidKey;
            }
            BOOST_OUTCOME_TRY(expected_reference, to_child_reference(child));
            consumed += 1;
        }
        else if (is_extension_node(*node)) {
            auto const path = decode_path(std::get<RawString>((*node)[0].value));
            if (!remaining.starts_with(path)) {
                return ProofError::InvalidKey;
            }
            BOOST_OUTCOME_TRY(
                expected_reference, to_child_reference((*node)[1]));
            consumed += path.nibble_size();
        }
        else if (is_leaf_node(*node)) {
            auto const path = decode_path(std::get<RawString>((*node)[0].value));
            if (remaining != path) {
                return ProofError::InvalidKey;
            }
            if (TANDEM_UNLIKELY(!is_last)) {
                return ProofError::WrongMerkleProof;
            }
            auto const *const value = std::get_if<RawString>(&(*node)[1].value);
            if (TANDEM_UNLIKELY(value == nullptr)) {
                return ProofError::UnexpectedType;
            }
            return *value;
        }
        else {
            return ProofError::UnexpectedType;
        }
    }

    // ran out of nodes before reaching a leaf
    return ProofError::WrongMerkleProof;
}

TANDEM_MPT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<tandem::mpt::ProofError>::mapping> const &
quick_status_code_from_enum<tandem::mpt::ProofError>::value_mappings()
{
    using tandem::mpt::ProofError;

    static std::initializer_list<mapping> const v = {
        {ProofError::Success, "success", {errc::success}},
        {ProofError::InvalidKey, "provided key doesn't match proof", {}},
        {ProofError::WrongMerkleProof, "computing merkle proof failed", {}},
        {ProofError::UnexpectedType, "invalid node type", {}},
        {ProofError::EmptyProof, "proof has no nodes", {}},
        {ProofError::TooManyNodes, "proof exceeds maximum depth", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
