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

#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>

#include <cstdint>

TANDEM_NAMESPACE_BEGIN

// Source of finalized state roots of the counterpart chain
class StateRootProvider
{
public:
    virtual ~StateRootProvider() = default;

    // Zero when no root is known for the height
    virtual bytes32_t get_state_root(uint64_t block_height) const = 0;

    virtual uint64_t get_latest_state_root_block_height() const = 0;
};

TANDEM_NAMESPACE_END
