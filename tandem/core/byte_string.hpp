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

#include <tandem/core/config.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

TANDEM_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;
using byte_string_view = std::basic_string_view<unsigned char>;

template <size_t N>
using byte_string_fixed = std::array<unsigned char, N>;

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return {reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

TANDEM_NAMESPACE_END
