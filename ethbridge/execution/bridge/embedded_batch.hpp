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
#include <ethbridge/core/int.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

ETHBRIDGE_NAMESPACE_BEGIN

/// Messages carried in the payload of a transaction sent to the reserved
/// address. signatures[i] authorizes required_signers()[i].
struct EmbeddedBatch
{
    std::vector<EmbeddedMessage> messages{};
    std::vector<byte_string> signatures{};

    /// Signers of every message in order, first occurrence kept
    std::vector<Address> required_signers() const;

    friend bool
    operator==(EmbeddedBatch const &, EmbeddedBatch const &) = default;
};

/// {"accountNumber":N,"chainId":"...","msgs":[...],"sequence":S}
std::string embedded_sign_bytes(
    EmbeddedBatch const &, std::string_view chain_id, int64_t account_number,
    int64_t sequence);

/// 65 byte compact signature over keccak256 of the sign document
std::optional<byte_string> sign_embedded_batch(
    EmbeddedBatch const &, std::string_view chain_id, int64_t account_number,
    int64_t sequence, SecretKey const &);

ETHBRIDGE_NAMESPACE_END
