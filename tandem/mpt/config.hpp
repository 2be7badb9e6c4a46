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

#include <cstddef>

#define TANDEM_MPT_NAMESPACE_BEGIN                                             \
    TANDEM_NAMESPACE_BEGIN namespace mpt                                       \
    {

#define TANDEM_MPT_NAMESPACE_END                                               \
    }                                                                          \
    TANDEM_NAMESPACE_END

#define TANDEM_MPT_NAMESPACE ::tandem::mpt

TANDEM_MPT_NAMESPACE_BEGIN

static constexpr unsigned char RLP_EMPTY_STRING = 0x80;

// Longest path is 64 nibbles of a hashed key, plus the leaf
static constexpr size_t MAX_PROOF_NODES = 65;

TANDEM_MPT_NAMESPACE_END
