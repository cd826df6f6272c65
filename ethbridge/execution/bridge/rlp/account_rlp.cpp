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

#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/rlp/account_rlp.hpp>
#include <ethbridge/execution/ethereum/core/rlp/int_rlp.hpp>
#include <ethbridge/execution/ethereum/rlp/decode.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>
#include <ethbridge/execution/ethereum/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

byte_string encode_account(Account const &account)
{
    return encode_list2(
        encode_signed(account.account_number), encode_signed(account.sequence));
}

Result<Account> decode_account(Address const &address, byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    Account account{.address = address};
    BOOST_OUTCOME_TRY(account.account_number, decode_signed(payload));
    BOOST_OUTCOME_TRY(account.sequence, decode_signed(payload));

    if (ETHBRIDGE_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return account;
}

ETHBRIDGE_RLP_NAMESPACE_END
