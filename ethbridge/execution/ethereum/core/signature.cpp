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

#include <ethbridge/core/config.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/execution/ethereum/core/signature.hpp>

#include <optional>

ETHBRIDGE_NAMESPACE_BEGIN

uint256_t get_v(SignatureAndChain const &sc) noexcept
{
    if (sc.chain_id.has_value()) {
        return (*sc.chain_id * 2u) + 35u + sc.y_parity;
    }
    return sc.y_parity ? 28u : 27u;
}

std::optional<SignatureAndChain> to_signature_and_chain(
    uint256_t const &v, uint256_t const &r, uint256_t const &s,
    uint256_t const &chain_id) noexcept
{
    SignatureAndChain sc{.r = r, .s = s};

    if (chain_id == 0) {
        if (v == 27u) {
            sc.y_parity = 0;
        }
        else if (v == 28u) {
            sc.y_parity = 1;
        }
        else {
            return std::nullopt;
        }
        return sc;
    }

    // computed wide so that very large chain ids cannot wrap
    uint512_t const base = uint512_t{chain_id} * 2u + 35u;
    uint512_t const wide_v{v};
    if (ETHBRIDGE_UNLIKELY(wide_v != base && wide_v != base + 1u)) {
        return std::nullopt;
    }
    sc.chain_id = chain_id;
    sc.y_parity = static_cast<uint8_t>(wide_v - base);
    return sc;
}

ETHBRIDGE_NAMESPACE_END
