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

#include <ethbridge/core/config.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/account_error.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <limits>

ETHBRIDGE_NAMESPACE_BEGIN

Result<Account> AccountStore::create_account(Address const &address)
{
    if (ETHBRIDGE_UNLIKELY(has_account(address))) {
        return AccountError::AccountExists;
    }
    Account const account{
        .address = address,
        .account_number = next_account_number(),
        .sequence = 0};
    BOOST_OUTCOME_TRY(set_account(account));
    return account;
}

Result<int64_t> AccountStore::get_sequence(Address const &address)
{
    BOOST_OUTCOME_TRY(auto const account, get_account(address));
    return account.sequence;
}

Result<void> AccountStore::increment_sequence(Address const &address)
{
    BOOST_OUTCOME_TRY(auto account, get_account(address));
    if (ETHBRIDGE_UNLIKELY(
            account.sequence == std::numeric_limits<int64_t>::max())) {
        return AccountError::SequenceOverflow;
    }
    ++account.sequence;
    return set_account(account);
}

ETHBRIDGE_NAMESPACE_END
