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
#include <ethbridge/execution/bridge/gas_meter.hpp>

#include <string>
#include <utility>

ETHBRIDGE_NAMESPACE_BEGIN

// Per-transaction execution context
class Context
{
    std::string chain_id_;
    GasMeter gas_meter_;

public:
    explicit Context(std::string chain_id, GasMeter gas_meter = GasMeter{})
        : chain_id_{std::move(chain_id)}
        , gas_meter_{gas_meter}
    {
    }

    std::string const &chain_id() const noexcept
    {
        return chain_id_;
    }

    GasMeter &gas_meter() noexcept
    {
        return gas_meter_;
    }

    GasMeter const &gas_meter() const noexcept
    {
        return gas_meter_;
    }

    Context with_gas_meter(GasMeter const gas_meter) const
    {
        return Context{chain_id_, gas_meter};
    }
};

ETHBRIDGE_NAMESPACE_END
