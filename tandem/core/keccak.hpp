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
#include <tandem/core/config.hpp>

#include <ethash/keccak.hpp>

#include <bit>

TANDEM_NAMESPACE_BEGIN

inline constexpr unsigned KECCAK256_SIZE = 32;

using hash256 = ::ethash::hash256;

static_assert(sizeof(hash256) == KECCAK256_SIZE);

inline hash256 keccak256(byte_string_view const data) noexcept
{
    return ::ethash::keccak256(data.data(), data.size());
}

inline bytes32_t to_bytes(hash256 const &h) noexcept
{
    return std::bit_cast<bytes32_t>(h);
}

TANDEM_NAMESPACE_END
