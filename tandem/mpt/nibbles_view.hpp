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
#include <tandem/mpt/config.hpp>

#include <algorithm>
#include <cstddef>

TANDEM_MPT_NAMESPACE_BEGIN

// Non-owning view of a range of nibbles over a byte string. The high nibble of
// each byte comes first.
class NibblesView
{
    unsigned char const *data_{nullptr};
    size_t begin_{0};
    size_t end_{0};

public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    NibblesView() = default;

    explicit NibblesView(byte_string_view const bytes) noexcept
        : data_{bytes.data()}
        , begin_{0}
        , end_{bytes.size() * 2}
    {
    }

    NibblesView(
        unsigned char const *const data, size_t const begin,
        size_t const end) noexcept
        : data_{data}
        , begin_{begin}
        , end_{end}
    {
        TANDEM_ASSERT(begin_ <= end_);
    }

    size_t nibble_size() const noexcept
    {
        return end_ - begin_;
    }

    bool empty() const noexcept
    {
        return begin_ == end_;
    }

    unsigned char get(size_t const i) const noexcept
    {
        TANDEM_ASSERT(i < nibble_size());
        size_t const idx = begin_ + i;
        unsigned char const byte = data_[idx / 2];
        return (idx % 2 == 0) ? static_cast<unsigned char>(byte >> 4)
                              : static_cast<unsigned char>(byte & 0x0f);
    }

    NibblesView substr(size_t const pos, size_t const count = npos) const noexcept
    {
        TANDEM_ASSERT(pos <= nibble_size());
        size_t const n = std::min(count, nibble_size() - pos);
        return NibblesView{data_, begin_ + pos, begin_ + pos + n};
    }

    bool starts_with(NibblesView const prefix) const noexcept
    {
        if (prefix.nibble_size() > nibble_size()) {
            return false;
        }
        for (size_t i = 0; i < prefix.nibble_size(); ++i) {
            if (get(i) != prefix.get(i)) {
                return false;
            }
        }
        return true;
    }

    size_t common_prefix_size(NibblesView const other) const noexcept
    {
        size_t const n = std::min(nibble_size(), other.nibble_size());
        size_t i = 0;
        while (i < n && get(i) == other.get(i)) {
            ++i;
        }
        return i;
    }

    bool operator==(NibblesView const &other) const noexcept
    {
        return nibble_size() == other.nibble_size() && starts_with(other);
    }
};

TANDEM_MPT_NAMESPACE_END
