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
#include <tandem/mpt/config.hpp>

#include <map>

TANDEM_MPT_NAMESPACE_BEGIN

// keccak256(rlp(""))
static constexpr bytes32_t EMPTY_TRIE_ROOT{
    0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32};

// In memory Merkle Patricia trie. Nodes are not cached, every root or proof
// computation rebuilds the structure from the sorted leaves.
class Trie
{
    std::map<byte_string, byte_string> leaves_;

public:
    // An empty value removes the key
    void upsert(byte_string_view key, byte_string_view value);
    void erase(byte_string_view key);

    bool empty() const noexcept
    {
        return leaves_.empty();
    }

    bytes32_t root_hash() const;

    // Rlp list of the nodes on the path to `key`, root first. For a missing
    // key the nodes up to the point of divergence are returned.
    byte_string prove(byte_string_view key) const;
};

TANDEM_MPT_NAMESPACE_END
