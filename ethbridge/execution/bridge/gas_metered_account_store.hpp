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
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <cstdint>

ETHBRIDGE_NAMESPACE_BEGIN

/// Charges every store access against a gas meter. Charges may throw
/// OutOfGas.
class GasMeteredAccountStore final : public AccountStore
{
    AccountStore &store_;
    GasMeter &meter_;
    GasConfig const &config_;

public:
    GasMeteredAccountStore(AccountStore &, GasMeter &, GasConfig const &);

    Result<Account> get_account(Address const &) override;
    bool has_account(Address const &) override;
    Result<void> set_account(Account const &) override;
    int64_t next_account_number() const override;
};

ETHBRIDGE_NAMESPACE_END
