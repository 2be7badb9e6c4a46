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

#include <tandem/core/address.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/int.hpp>
#include <tandem/rlp/config.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>

TANDEM_RLP_NAMESPACE_BEGIN

inline constexpr unsigned char STRING_OFFSET = 0x80;
inline constexpr unsigned char LIST_OFFSET = 0xc0;
inline constexpr size_t SHORT_PAYLOAD_LIMIT = 56;

// Big endian representation without leading zero bytes
inline byte_string to_big_compact(uint256_t const &n)
{
    auto const be = intx::be::store<bytes32_t>(n);
    byte_string_view view{be.bytes, sizeof(bytes32_t)};
    while (!view.empty() && view.front() == 0) {
        view.remove_prefix(1);
    }
    return byte_string{view};
}

namespace impl
{
    inline byte_string encode_header(unsigned char const offset, size_t const size)
    {
        byte_string header;
        if (size < SHORT_PAYLOAD_LIMIT) {
            header.push_back(static_cast<unsigned char>(offset + size));
        }
        else {
            auto const length = to_big_compact(uint256_t{size});
            header.push_back(
                static_cast<unsigned char>(offset + 55 + length.size()));
            header += length;
        }
        return header;
    }
}

inline byte_string encode_string2(byte_string_view const str)
{
    if (str.size() == 1 && str[0] < STRING_OFFSET) {
        return byte_string{str};
    }
    return impl::encode_header(STRING_OFFSET, str.size()) + byte_string{str};
}

// Wraps already encoded items into a list
inline byte_string encode_list2(byte_string_view const payload)
{
    return impl::encode_header(LIST_OFFSET, payload.size()) +
           byte_string{payload};
}

template <class... Args>
    requires(sizeof...(Args) > 1)
byte_string encode_list2(Args const &...items)
{
    byte_string payload;
    (payload += ... += items);
    return encode_list2(byte_string_view{payload});
}

inline byte_string encode_unsigned(uint256_t const &n)
{
    return encode_string2(to_big_compact(n));
}

template <std::unsigned_integral T>
byte_string encode_unsigned(T const n)
{
    return encode_unsigned(uint256_t{n});
}

inline byte_string encode_bytes32(bytes32_t const &b)
{
    return encode_string2(to_byte_string_view(b));
}

inline byte_string encode_address(Address const &a)
{
    return encode_string2(to_byte_string_view(a));
}

TANDEM_RLP_NAMESPACE_END
