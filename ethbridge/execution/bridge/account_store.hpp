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

#include <ethbridge/core/config.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/execution/bridge/account.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <cstdint>

ETHBRIDGE_NAMESPACE_BEGIN

/// Keyed account records. Implementations supply the storage primitives;
/// creation and sequence handling are layered on top of them.
struct AccountStore
{
    virtual ~AccountStore() = default;

    /// AccountError::UnknownAccount when absent
    virtual Result<Account> get_account(Address const &) = 0;
    virtual bool has_account(Address const &) = 0;
    // insert or overwrite
    virtual Result<void> set_account(Account const &) = 0;
    virtual int64_t next_account_number() const = 0;

    /// Creates a record at sequence zero with the next account number
    Result<Account> create_account(Address const &);
    Result<int64_t> get_sequence(Address const &);
    Result<void> increment_sequence(Address const &);
};

ETHBRIDGE_NAMESPACE_END
