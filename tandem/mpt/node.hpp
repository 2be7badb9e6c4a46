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
#include <tandem/mpt/config.hpp>
#include <tandem/mpt/nibbles_view.hpp>
#include <tandem/rlp/item.hpp>

#include <variant>

TANDEM_MPT_NAMESPACE_BEGIN

using RawList = rlp::RawList;
using RawString = rlp::RawString;
using RawNode = RawList;

static constexpr size_t BRANCH_NODE_SIZE = 17;
static constexpr size_t SHORT_NODE_SIZE = 2;

// Hex prefix flags, stored in the high nibble of the first path byte
static constexpr unsigned char ODD_PATH_FLAG = 0x10;
static constexpr unsigned char LEAF_PATH_FLAG = 0x20;

inline bool is_branch_node(RawNode const &node)
{
    return node.size() == BRANCH_NODE_SIZE;
}

namespace impl
{
    inline RawString const *short_node_path(RawNode const &node)
    {
        if (node.size() != SHORT_NODE_SIZE) {
            return nullptr;
        }
        auto const *const path = std::get_if<RawString>(&node[0].value);
        if (path == nullptr || path->empty() || ((*path)[0] >> 4) > 3) {
            return nullptr;
        }
        return path;
    }
}

inline bool is_extension_node(RawNode const &node)
{
    auto const *const path = impl::short_node_path(node);
    return path != nullptr && !((*path)[0] & LEAF_PATH_FLAG);
}

inline bool is_leaf_node(RawNode const &node)
{
    auto const *const path = impl::short_node_path(node);
    return path != nullptr && ((*path)[0] & LEAF_PATH_FLAG);
}

// Decodes hex prefix nibbles. However, it does not add the nibbles terminator
// for leaves
inline NibblesView decode_path(RawString const &nibbles)
{
    bool const is_odd_len = nibbles[0] & ODD_PATH_FLAG;
    if (is_odd_len) {
        return NibblesView{nibbles}.substr(1);
    }
    else {
        return NibblesView{nibbles}.substr(2);
    }
}

inline byte_string compact_encode(NibblesView const path, bool const is_leaf)
{
    byte_string result;
    unsigned char flags = is_leaf ? LEAF_PATH_FLAG : 0;
    size_t i = 0;
    if (path.nibble_size() % 2) {
        flags |= ODD_PATH_FLAG;
        result.push_back(static_cast<unsigned char>(flags | path.get(0)));
        i = 1;
    }
    else {
        result.push_back(flags);
    }
    for (; i < path.nibble_size(); i += 2) {
        result.push_back(
            static_cast<unsigned char>((path.get(i) << 4) | path.get(i + 1)));
    }
    return result;
}

TANDEM_MPT_NAMESPACE_END
