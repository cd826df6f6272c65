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

#include <ethbridge/core/int.hpp>

#include <cstdint>
#include <optional>

ETHBRIDGE_NAMESPACE_BEGIN

struct SignatureAndChain
{
    uint256_t r{};
    uint256_t s{};
    std::optional<uint256_t> chain_id{};
    uint8_t y_parity{};

    friend bool
    operator==(SignatureAndChain const &, SignatureAndChain const &) = default;
};

static_assert(sizeof(SignatureAndChain) == 112);
static_assert(alignof(SignatureAndChain) == 8);

// largest chain id whose EIP-155 `v` still fits in 256 bits
inline constexpr uint256_t MAX_CHAIN_ID = (UINT256_MAX - 36) / 2;

/// EIP-155 `v`: 27 + y_parity without a chain id, otherwise
/// 35 + 2 * chain_id + y_parity; chain_id must not exceed MAX_CHAIN_ID
uint256_t get_v(SignatureAndChain const &) noexcept;

/// Reverses the `v` encoding, expecting `v` to have been produced for
/// `chain_id`; a chain id of zero expects the unprotected 27/28 form. Returns
/// nothing when `v` does not belong to `chain_id`.
std::optional<SignatureAndChain> to_signature_and_chain(
    uint256_t const &v, uint256_t const &r, uint256_t const &s,
    uint256_t const &chain_id) noexcept;

ETHBRIDGE_NAMESPACE_END
