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
#include <tandem/core/int.hpp>
#include <tandem/mpt/trie.hpp>

#include <cstdint>

TANDEM_NAMESPACE_BEGIN

// keccak256 of empty code
static constexpr bytes32_t NULL_HASH{
    0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

struct Account
{
    uint64_t nonce{0};
    uint256_t balance{0};
    bytes32_t storage_root{mpt::EMPTY_TRIE_ROOT};
    bytes32_t code_hash{NULL_HASH};

    friend bool operator==(Account const &, Account const &) = default;
};

TANDEM_NAMESPACE_END
