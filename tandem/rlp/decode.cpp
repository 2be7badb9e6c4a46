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
#include <tandem/core/likely.h>
#include <tandem/core/result.hpp>
#include <tandem/rlp/decode.hpp>
#include <tandem/rlp/decode_error.hpp>
#include <tandem/rlp/encode.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

TANDEM_RLP_NAMESPACE_BEGIN

namespace
{
    enum class ItemType
    {
        String,
        List,
    };

    struct Metadata
    {
        ItemType type;
        byte_string_view payload;
    };

    Result<Metadata> parse_metadata(byte_string_view &enc)
    {
        if (TANDEM_UNLIKELY(enc.empty())) {
            return DecodeError::InputTooShort;
        }

        unsigned char const prefix = enc[0];
        ItemType type;
        size_t header_size;
        size_t payload_size;

        if (prefix < STRING_OFFSET) {
            type = ItemType::String;
            header_size = 0;
            payload_size = 1;
        }
        else if (prefix < LIST_OFFSET) {
            type = ItemType::String;
            unsigned char const short_limit = STRING_OFFSET + 55;
            if (prefix <= short_limit) {
                header_size = 1;
                payload_size = prefix - STRING_OFFSET;
            }
            else {
                header_size = 1 + static_cast<size_t>(prefix - short_limit);
            }
        }
        else {
            type = ItemType::List;
            unsigned char const short_limit = LIST_OFFSET + 55;
            if (prefix <= short_limit) {
                header_size = 1;
                payload_size = prefix - LIST_OFFSET;
            }
            else {
                header_size = 1 + static_cast<size_t>(prefix - short_limit);
            }
        }

        if (header_size > 1) {
            // long form, the length itself is big endian encoded
            if (TANDEM_UNLIKELY(enc.size() < header_size)) {
                return DecodeError::InputTooShort;
            }
            BOOST_OUTCOME_TRY(
                payload_size,
                decode_raw_num<uint64_t>(enc.substr(1, header_size - 1)));
            if (TANDEM_UNLIKELY(payload_size < SHORT_PAYLOAD_LIMIT)) {
                return DecodeError::NonCanonicalSize;
            }
        }

        if (TANDEM_UNLIKELY(enc.size() - header_size < payload_size)) {
            return DecodeError::InputTooShort;
        }

        Metadata const result{
            .type = type, .payload = enc.substr(header_size, payload_size)};

        if (TANDEM_UNLIKELY(
                type == ItemType::String && header_size == 1 &&
                payload_size == 1 && result.payload[0] < STRING_OFFSET)) {
            // single bytes below 0x80 encode as themselves
            return DecodeError::NonCanonicalSize;
        }

        enc.remove_prefix(header_size + payload_size);
        return result;
    }
}

Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const metadata, parse_metadata(enc));
    if (TANDEM_UNLIKELY(metadata.type != ItemType::String)) {
        return DecodeError::TypeUnexpected;
    }
    return metadata.payload;
}

Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const metadata, parse_metadata(enc));
    if (TANDEM_UNLIKELY(metadata.type != ItemType::List)) {
        return DecodeError::TypeUnexpected;
    }
    return metadata.payload;
}

TANDEM_RLP_NAMESPACE_END
