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
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/account_error.hpp>
#include <ethbridge/execution/bridge/in_memory_account_store.hpp>
#include <ethbridge/execution/bridge/rlp/account_rlp.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <algorithm>
#include <cstdint>

ETHBRIDGE_NAMESPACE_BEGIN

Result<Account> InMemoryAccountStore::get_account(Address const &address)
{
    auto const it = records_.find(address);
    if (it == records_.end()) {
        return AccountError::UnknownAccount;
    }
    byte_string_view enc{it->second};
    return rlp::decode_account(address, enc);
}

bool InMemoryAccountStore::has_account(Address const &address)
{
    return records_.contains(address);
}

Result<void> InMemoryAccountStore::set_account(Account const &account)
{
    records_.insert_or_assign(account.address, rlp::encode_account(account));
    next_account_number_ =
        std::max(next_account_number_, account.account_number + 1);
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

int64_t InMemoryAccountStore::next_account_number() const
{
    return next_account_number_;
}

ETHBRIDGE_NAMESPACE_END
