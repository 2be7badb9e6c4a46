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
#include <tandem/mpt/node.hpp>
#include <tandem/mpt/nibbles_view.hpp>
#include <tandem/mpt/trie.hpp>
#include <tandem/rlp/encode.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <vector>

TANDEM_MPT_NAMESPACE_BEGIN

namespace
{
    using Iterator = std::map<byte_string, byte_string>::const_iterator;

    byte_string to_child_reference(byte_string const &encoded)
    {
        if (encoded.size() < KECCAK256_SIZE) {
            return encoded;
        }
        return rlp::encode_bytes32(to_bytes(keccak256(encoded)));
    }

    class NodeEncoder
    {
        std::optional<NibblesView> target_;
        std::vector<byte_string> path_nodes_;

        byte_string
        record(byte_string encoded, bool const on_path)
        {
            if (on_path) {
                path_nodes_.push_back(encoded);
            }
            return encoded;
        }

        byte_string encode_branch(
            Iterator first, Iterator const last, size_t const depth,
            bool const on_path)
        {
            byte_string payload;
            byte_string value = rlp::encode_string2({});
            if (NibblesView{first->first}.nibble_size() == depth) {
                // keys sort before their extensions
                value = rlp::encode_string2(first->second);
                ++first;
            }
            for (unsigned char nibble = 0; nibble < 16; ++nibble) {
                auto const child_last =
                    std::find_if(first, last, [&](auto const &leaf) {
                        return NibblesView{leaf.first}.get(depth) != nibble;
                    });
                if (first == child_last) {
                    payload += rlp::encode_string2({});
                    continue;
                }
                bool const child_on_path =
                    on_path && target_->nibble_size() > depth &&
                    target_->get(depth) == nibble;
                payload += to_child_reference(
                    encode(first, child_last, depth + 1, child_on_path));
                first = child_last;
            }
            payload += value;
            return record(rlp::encode_list2(payload), on_path);
        }

    public:
        explicit NodeEncoder(std::optional<NibblesView> const target)
            : target_{target}
        {
        }

        byte_string encode(
            Iterator const first, Iterator const last, size_t const depth,
            bool const on_path)
        {
            NibblesView const first_key{first->first};
            if (std::next(first) == last) {
                auto const path =
                    compact_encode(first_key.substr(depth), true);
                return record(
                    rlp::encode_list2(
                        rlp::encode_string2(path),
                        rlp::encode_string2(first->second)),
                    on_path);
            }

            NibblesView const last_key{std::prev(last)->first};
            size_t const common =
                depth + first_key.substr(depth).common_prefix_size(
                            last_key.substr(depth));
            if (common == depth) {
                return encode_branch(first, last, depth, on_path);
            }

            auto const relpath = first_key.substr(depth, common - depth);
            bool const child_on_path =
                on_path && target_->substr(depth).starts_with(relpath);
            auto const child = encode_branch(first, last, common, child_on_path);
            return record(
                rlp::encode_list2(
                    rlp::encode_string2(compact_encode(relpath, false)),
                    to_child_reference(child)),
                on_path);
        }

        std::vector<byte_string> path_nodes() const
        {
            // nodes were recorded children first
            return {path_nodes_.rbegin(), path_nodes_.rend()};
        }
    };
}

void Trie::upsert(byte_string_view const key, byte_string_view const value)
{
    if (value.empty()) {
        erase(key);
        return;
    }
    leaves_.insert_or_assign(byte_string{key}, byte_string{value});
}

void Trie::erase(byte_string_view const key)
{
    leaves_.erase(byte_string{key});
}

bytes32_t Trie::root_hash() const
{
    if (leaves_.empty()) {
        return EMPTY_TRIE_ROOT;
    }
    NodeEncoder encoder{std::nullopt};
    auto const root = encoder.encode(leaves_.begin(), leaves_.end(), 0, false);
    return to_bytes(keccak256(root));
}

byte_string Trie::prove(byte_string_view const key) const
{
    if (leaves_.empty()) {
        return rlp::encode_list2(byte_string_view{});
    }
    NodeEncoder encoder{NibblesView{key}};
    encoder.encode(leaves_.begin(), leaves_.end(), 0, true);
    byte_string payload;
    for (auto const &node : encoder.path_nodes()) {
        payload += node;
    }
    return rlp::encode_list2(payload);
}

TANDEM_MPT_NAMESPACE_END
