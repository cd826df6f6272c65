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
#include <ethbridge/execution/bridge/account_store.hpp>
#include <ethbridge/execution/bridge/context.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/tx_result.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

ETHBRIDGE_NAMESPACE_BEGIN

struct AnteHandlerConfig
{
    // recipient that marks a transaction as an embedded batch carrier
    Address reserved_address;
    GasConfig gas;

    explicit AnteHandlerConfig(
        Address const &reserved_address, GasConfig const &gas = GasConfig{})
        : reserved_address{reserved_address}
        , gas{gas}
    {
    }
};

/// Pre-execution gate. Meters gas against the transaction's gas limit,
/// recovers the sender under the context chain id and, for carrier
/// transactions, authorizes the embedded batch. Running out of gas is
/// reported as AnteError::OutOfGas; any other exception propagates.
class AnteHandler
{
    AnteHandlerConfig const config_;
    AccountStore &store_;

public:
    AnteHandler(AnteHandlerConfig, AccountStore &);

    AnteHandlerConfig const &config() const noexcept
    {
        return config_;
    }

    AnteOutcome operator()(Context const &, SubmittedTx const &) const;
};

ETHBRIDGE_NAMESPACE_END
