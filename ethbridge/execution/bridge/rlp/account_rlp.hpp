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

#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

// [account_number, sequence]; the address is the record's key
byte_string encode_account(Account const &);

Result<Account> decode_account(Address const &, byte_string_view &);

ETHBRIDGE_RLP_NAMESPACE_END
