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
#include <tandem/core/result.hpp>

TANDEM_NAMESPACE_BEGIN

// Proves that `encoded_account` is stored in the state trie under `path`, the
// keccak256 of the account address, and returns the account's storage root.
Result<bytes32_t> verify_account(
    byte_string_view encoded_account, byte_string_view parent_nodes,
    bytes32_t const &path, bytes32_t const &state_root);

// Returns the value of storage slot `slot` proven against `storage_root`. The
// trie key is keccak256(slot).
Result<bytes32_t> verify_storage(
    bytes32_t const &slot, byte_string_view parent_nodes,
    bytes32_t const &storage_root);

TANDEM_NAMESPACE_END
