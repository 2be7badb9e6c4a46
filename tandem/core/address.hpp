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
#include <tandem/core/config.hpp>

#include <evmc/evmc.hpp>

TANDEM_NAMESPACE_BEGIN

using Address = ::evmc::address;

using ::evmc::literals::operator""_address;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

inline byte_string_view to_byte_string_view(Address const &a) noexcept
{
    return {a.bytes, sizeof(Address)};
}

TANDEM_NAMESPACE_END
