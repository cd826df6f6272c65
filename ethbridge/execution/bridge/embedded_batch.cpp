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

#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/keccak.hpp>
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

ETHBRIDGE_NAMESPACE_BEGIN

std::vector<Address> EmbeddedBatch::required_signers() const
{
    std::vector<Address> signers;
    std::unordered_set<Address> seen;
    for (auto const &msg : messages) {
        for (auto const &signer : message_signers(msg)) {
            if (seen.insert(signer).second) {
                signers.push_back(signer);
            }
        }
    }
    return signers;
}

std::string embedded_sign_bytes(
    EmbeddedBatch const &batch, std::string_view const chain_id,
    int64_t const account_number, int64_t const sequence)
{
    // message documents are spliced in verbatim rather than re-serialized
    std::string msgs;
    for (auto const &msg : batch.messages) {
        if (!msgs.empty()) {
            msgs += ',';
        }
        msgs += message_sign_bytes(msg);
    }
    return "{\"accountNumber\":" + std::to_string(account_number) +
           ",\"chainId\":" + nlohmann::json(chain_id).dump() + ",\"msgs\":[" +
           msgs + "],\"sequence\":" + std::to_string(sequence) + "}";
}

std::optional<byte_string> sign_embedded_batch(
    EmbeddedBatch const &batch, std::string_view const chain_id,
    int64_t const account_number, int64_t const sequence,
    SecretKey const &secret_key)
{
    auto const doc =
        embedded_sign_bytes(batch, chain_id, account_number, sequence);
    auto const sig = sign_digest(
        to_bytes(keccak256(to_byte_string_view(doc))), secret_key);
    if (!sig.has_value()) {
        return std::nullopt;
    }
    return to_compact(*sig);
}

ETHBRIDGE_NAMESPACE_END
