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
#include <ethbridge/execution/bridge/chain_id.hpp>

#include <optional>
#include <string_view>

ETHBRIDGE_NAMESPACE_BEGIN

std::optional<uint256_t> parse_chain_id(std::string_view s) noexcept
{
    if (s.starts_with('+')) {
        s.remove_prefix(1);
    }
    if (s.empty()) {
        return std::nullopt;
    }
    uint256_t id{0};
    for (char const c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint256_t const digit{static_cast<uint64_t>(c - '0')};
        if (id > (UINT256_MAX - digit) / 10u) {
            return std::nullopt;
        }
        id = id * 10u + digit;
    }
    return id;
}

ETHBRIDGE_NAMESPACE_END
