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
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/bridge/gas_meter.hpp>
#include <ethbridge/execution/bridge/tx_result.hpp>

ETHBRIDGE_NAMESPACE_BEGIN

/// Checks the batch is well formed and that every required signer signed it
/// at its current sequence. Each signer's sequence is advanced as soon as its
/// signature verifies, so a failure part way leaves earlier signers advanced.
/// May throw OutOfGas from the context meter.
AnteOutcome validate_embedded_batch(
    Context &, EmbeddedBatch const &, AccountStore &, GasConfig const &);

ETHBRIDGE_NAMESPACE_END
