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
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/core/math.hpp>
#include <tandem/state/big_endian.hpp>

#include <cstdint>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>

TANDEM_NAMESPACE_BEGIN

// Helpers for encoding types into solidity encoding ABI. This is used for
// events and for the hashes that both chains must be able to reproduce from
// public call arguments, as `keccak256(abi.encode(...))` would.

//////////////////////////////////////////////////////////////
// Standalone functions for encoding types.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
//////////////////////////////////////////////////////////////
// keccak256 of a solidity signature, used for event topics and type hashes,
// e.g. "Transfer(address,address,uint256)"
inline bytes32_t abi_signature_hash(std::string_view const signature)
{
    return to_bytes(keccak256(to_byte_string_view(signature)));
}

inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

template <BigEndianType I>
bytes32_t abi_encode_int(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    std::memcpy(&output.bytes[offset], &i, sizeof(I));
    return output;
}

inline bytes32_t abi_encode_bool(bool const b)
{
    bytes32_t output{};
    output.bytes[31] = b ? 1 : 0;
    return output;
}

inline byte_string abi_encode_bytes(byte_string_view const input)
{
    byte_string output;
    u256_be const size{input.size()};
    size_t const padding =
        round_up(input.size(), sizeof(bytes32_t)) - input.size();
    output += to_byte_string_view(abi_encode_int(size));
    output += input;
    output.append(padding, 0);
    return output;
}

// Encodes a tuple
//  * static types : Have size <= 32 are padded out and added to the "head".
//  * dynamic types: The "head" stores the offset in the tail, and the actual
//                   data is stored in the tail.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t const &data)
    {
        head_ += to_byte_string_view(data);
    }

    void add_dynamic(byte_string const &data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_ += to_byte_string_view(bytes32_t{});
        tail_ += data;
    }

public:
    AbiEncoder &add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
        return *this;
    }

    template <BigEndianType I>
    AbiEncoder &add_int(I const &i)
    {
        add_static(abi_encode_int(i));
        return *this;
    }

    AbiEncoder &add_uint(uint256_t const &i)
    {
        return add_int(u256_be{i});
    }

    AbiEncoder &add_bytes32(bytes32_t const &b)
    {
        add_static(b);
        return *this;
    }

    AbiEncoder &add_bool(bool const b)
    {
        add_static(abi_encode_bool(b));
        return *this;
    }

    AbiEncoder &add_bytes(byte_string_view const data)
    {
        add_dynamic(abi_encode_bytes(data));
        return *this;
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            u256_be const offset =
                static_cast<uint256_t>(head_.size()) + tail_cumsum;
            bytes32_t const encoded = abi_encode_int(offset);
            std::memcpy(&head_[unresolved], encoded.bytes, sizeof(bytes32_t));
        }

        return std::move(head_) + std::move(tail_);
    }
};

TANDEM_NAMESPACE_END
