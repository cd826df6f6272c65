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
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

byte_string encode_embedded_message(EmbeddedMessage const &);
byte_string encode_embedded_batch(EmbeddedBatch const &);

Result<EmbeddedMessage> decode_embedded_message(byte_string_view &);
Result<EmbeddedBatch> decode_embedded_batch(byte_string_view &);

/// Decodes the whole payload of a carrier transaction; trailing bytes are an
/// error
Result<EmbeddedBatch> decode_embedded_batch(WireTransaction const &);

ETHBRIDGE_RLP_NAMESPACE_END
