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

#include <tandem/core/likely.h>
#include <tandem/rlp/decode.hpp>
#include <tandem/rlp/decode_error.hpp>
#include <tandem/rlp/encode.hpp>
#include <tandem/rlp/item.hpp>

#include <boost/outcome/try.hpp>

#include <utility>

TANDEM_RLP_NAMESPACE_BEGIN

namespace
{

    Result<RawItem> decode_helper(byte_string_view &enc, size_t const depth)
    {
        if (TANDEM_UNLIKELY(depth > MAX_ITEM_DEPTH)) {
            return DecodeError::Overflow;
        }
        if (TANDEM_UNLIKELY(enc.empty())) {
            return DecodeError::InputTooShort;
        }
        RawItem output;
        if (enc[0] >= LIST_OFFSET) {
            BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
            RawList list;
            while (!payload.empty()) {
                BOOST_OUTCOME_TRY(auto elem, decode_helper(payload, depth + 1));
                list.emplace_back(std::move(elem));
            }
            output.value = std::move(list);
        }
        else {
            BOOST_OUTCOME_TRY(auto const string, parse_string_metadata(enc));
            output.value = RawString{string};
        }
        return output;
    }

}

Result<RawItem> decode_item(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto res, decode_helper(enc, 0));
    if (TANDEM_UNLIKELY(!enc.empty())) {
        return DecodeError::InputTooLong;
    }
    return res;
}

byte_string encode_item(RawItem const &item)
{
    if (auto const *const list = std::get_if<RawList>(&item.value)) {
        byte_string payload;
        for (auto const &elem : *list) {
            payload += encode_item(elem);
        }
        return encode_list2(payload);
    }
    return encode_string2(std::get<RawString>(item.value));
}

TANDEM_RLP_NAMESPACE_END
