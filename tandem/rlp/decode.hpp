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
#include <tandem/core/likely.h>
#include <tandem/core/result.hpp>
#include <tandem/rlp/config.hpp>
#include <tandem/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstdint>
#include <cstring>

TANDEM_RLP_NAMESPACE_BEGIN

// All decode functions consume the decoded item from the front of `enc`

Result<byte_string_view> parse_string_metadata(byte_string_view &enc);
Result<byte_string_view> parse_list_metadata(byte_string_view &enc);

inline Result<byte_string_view> decode_string(byte_string_view &enc)
{
    return parse_string_metadata(enc);
}

// Big endian integer without leading zeros
template <typename T>
    requires std::unsigned_integral<T> || std::same_as<T, uint256_t>
Result<T> decode_raw_num(byte_string_view const enc)
{
    if (enc.empty()) {
        return T{0};
    }
    if (TANDEM_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }
    if (TANDEM_UNLIKELY(enc[0] == 0)) {
        return DecodeError::LeadingZero;
    }
    T result{0};
    for (auto const byte : enc) {
        result = (result << 8) | T{byte};
    }
    return result;
}

template <typename T>
    requires std::unsigned_integral<T> || std::same_as<T, uint256_t>
Result<T> decode_unsigned(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    return decode_raw_num<T>(payload);
}

template <size_t N>
Result<byte_string_fixed<N>> decode_byte_string_fixed(byte_string_view &enc)
{
    byte_string_fixed<N> result;
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (TANDEM_UNLIKELY(payload.size() != N)) {
        return DecodeError::ArrayLengthUnexpected;
    }
    std::memcpy(result.data(), payload.data(), N);
    return result;
}

inline Result<bytes32_t> decode_bytes32(byte_string_view &enc)
{
    bytes32_t result;
    BOOST_OUTCOME_TRY(auto const raw, decode_byte_string_fixed<32>(enc));
    std::memcpy(result.bytes, raw.data(), sizeof(bytes32_t));
    return result;
}

inline Result<Address> decode_address(byte_string_view &enc)
{
    Address result;
    BOOST_OUTCOME_TRY(auto const raw, decode_byte_string_fixed<20>(enc));
    std::memcpy(result.bytes, raw.data(), sizeof(Address));
    return result;
}

TANDEM_RLP_NAMESPACE_END
