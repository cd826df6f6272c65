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
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/cached_account_store.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstdint>

ETHBRIDGE_NAMESPACE_BEGIN

CachedAccountStore::CachedAccountStore(AccountStore &parent)
    : parent_{parent}
{
}

Result<Account> CachedAccountStore::get_account(Address const &address)
{
    auto const it = pending_.find(address);
    if (it != pending_.end()) {
        return it->second;
    }
    return parent_.get_account(address);
}

bool CachedAccountStore::has_account(Address const &address)
{
    return pending_.contains(address) || parent_.has_account(address);
}

Result<void> CachedAccountStore::set_account(Account const &account)
{
    pending_.insert_or_assign(account.address, account);
    next_account_number_ =
        std::max(next_account_number_, account.account_number + 1);
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

int64_t CachedAccountStore::next_account_number() const
{
    return std::max(parent_.next_account_number(), next_account_number_);
}

Result<void> CachedAccountStore::write()
{
    for (auto const &[address, account] : pending_) {
        BOOST_OUTCOME_TRY(parent_.set_account(account));
    }
    discard();
    using BOOST_OUTCOME_V2_NAMESPACE::success;
    return success();
}

void CachedAccountStore::discard() noexcept
{
    pending_.clear();
    next_account_number_ = 0;
}

ETHBRIDGE_NAMESPACE_END
