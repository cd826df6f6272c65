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
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

byte_string encode_wire_transaction(WireTransaction const &);

/// Pre-signature fields, followed by (chain_id, 0, 0) unless chain_id is zero
byte_string
encode_wire_transaction_for_signing(TxData const &, uint256_t const &chain_id);

Result<WireTransaction> decode_wire_transaction(byte_string_view &);

ETHBRIDGE_RLP_NAMESPACE_END
