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
#include <tandem/core/likely.h>
#include <tandem/core/result.hpp>
#include <tandem/rlp/config.hpp>
#include <tandem/rlp/decode_error.hpp>

#include <variant>
#include <vector>

TANDEM_RLP_NAMESPACE_BEGIN

inline constexpr size_t MAX_ITEM_DEPTH = 128;

struct RawItem;
using RawString = byte_string;
using RawList = std::vector<RawItem>;

// Generic tree of an rlp encoding, used where the schema is only known while
// walking the data (e.g. trie nodes)
struct RawItem
{
    std::variant<RawString, RawList> value;
};

Result<RawItem> decode_item(byte_string_view enc);
byte_string encode_item(RawItem const &);

template <typename T>
Result<T const *> unwrap_item(RawItem const &item)
{
    if (auto const *const p = std::get_if<T>(&item.value);
        TANDEM_LIKELY(p != nullptr)) {
        return p;
    }
    return DecodeError::TypeUnexpected;
}

TANDEM_RLP_NAMESPACE_END
