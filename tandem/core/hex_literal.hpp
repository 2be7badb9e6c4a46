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

#include <tandem/core/assert.h>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/config.hpp>

#include <evmc/hex.hpp>

#include <iterator>
#include <string_view>

TANDEM_NAMESPACE_BEGIN

inline byte_string from_hex(std::string_view const hex)
{
    byte_string out;
    bool const ok = ::evmc::from_hex(hex, std::back_inserter(out));
    TANDEM_ASSERT(ok);
    return out;
}

namespace literals
{
    // Integer literal of any length, e.g. 0xdeadbeef_hex
    inline byte_string operator""_hex(char const *const s)
    {
        return from_hex(std::string_view{s});
    }
}

TANDEM_NAMESPACE_END
