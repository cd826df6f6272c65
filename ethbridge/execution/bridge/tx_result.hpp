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
#include <ethbridge/execution/bridge/context.hpp>
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

#include <cstdint>
#include <string>
#include <variant>

ETHBRIDGE_NAMESPACE_BEGIN

struct TxResult
{
    Result<void> status{outcome::success()};
    std::string log{};
    uint64_t gas_wanted{0};
    uint64_t gas_used{0};

    bool is_ok() const noexcept
    {
        return !status.has_error();
    }
};

struct AnteOutcome
{
    Context context;
    TxResult result{};
    bool abort{false};
};

// Anything the pipeline can be handed; only wire transactions are accepted
// at the top level
using SubmittedTx = std::variant<WireTransaction, EmbeddedBatch>;

ETHBRIDGE_NAMESPACE_END
