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
#include <tandem/core/result.hpp>
#include <tandem/rlp/config.hpp>
#include <tandem/state/account.hpp>

TANDEM_RLP_NAMESPACE_BEGIN

// [nonce, balance, storage_root, code_hash], the leaf value of the state trie
byte_string encode_account(Account const &);

Result<Account> decode_account(byte_string_view &);

TANDEM_RLP_NAMESPACE_END
