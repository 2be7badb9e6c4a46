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

#include <tandem/core/byte_string.hpp>
#include <tandem/core/likely.h>
#include <tandem/core/result.hpp>
#include <tandem/rlp/decode.hpp>
#include <tandem/rlp/decode_error.hpp>
#include <tandem/rlp/encode.hpp>
#include <tandem/state/account.hpp>
#include <tandem/state/account_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

TANDEM_RLP_NAMESPACE_BEGIN

byte_string encode_account(Account const &account)
{
    return encode_list2(
        encode_unsigned(account.nonce),
        encode_unsigned(account.balance),
        encode_bytes32(account.storage_root),
        encode_bytes32(account.code_hash));
}

Result<Account> decode_account(byte_string_view &enc)
{
    Account account;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    BOOST_OUTCOME_TRY(account.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(account.balance, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(account.storage_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(account.code_hash, decode_bytes32(payload));
    if (TANDEM_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    return account;
}

TANDEM_RLP_NAMESPACE_END
