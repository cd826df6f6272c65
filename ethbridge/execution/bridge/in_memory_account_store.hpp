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
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <cstddef>
#include <cstdint>
#include <map>

ETHBRIDGE_NAMESPACE_BEGIN

// Records are kept RLP encoded so that metered reads see their real size
class InMemoryAccountStore final : public AccountStore
{
    std::map<Address, byte_string> records_{};
    int64_t next_account_number_{0};

public:
    Result<Account> get_account(Address const &) override;
    bool has_account(Address const &) override;
    Result<void> set_account(Account const &) override;
    int64_t next_account_number() const override;

    size_t size() const noexcept
    {
        return records_.size();
    }
};

ETHBRIDGE_NAMESPACE_END
