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
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/config.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <cstdint>
#include <optional>

ETHBRIDGE_NAMESPACE_BEGIN

using SecretKey = bytes32_t;

struct RecoverableSignature
{
    uint256_t r{};
    uint256_t s{};
    uint8_t y_parity{};

    friend bool operator==(
        RecoverableSignature const &, RecoverableSignature const &) = default;
};

inline constexpr size_t COMPACT_SIGNATURE_SIZE = 65;

std::optional<RecoverableSignature>
sign_digest(bytes32_t const &digest, SecretKey const &);

std::optional<Address>
recover_address(bytes32_t const &digest, RecoverableSignature const &);

std::optional<Address> address_from_secret(SecretKey const &);

// EIP-2: r and s within the curve order, s in the lower half
bool is_valid_signature(uint256_t const &r, uint256_t const &s) noexcept;

/// r || s || y_parity
byte_string to_compact(RecoverableSignature const &);

std::optional<RecoverableSignature> from_compact(byte_string_view);

ETHBRIDGE_NAMESPACE_END
