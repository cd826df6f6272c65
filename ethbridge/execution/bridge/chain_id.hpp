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
#include <ethbridge/core/int.hpp>

#include <optional>
#include <string_view>

ETHBRIDGE_NAMESPACE_BEGIN

/// Base 10 with an optional leading `+`; no other sign, prefix or
/// surrounding whitespace
std::optional<uint256_t> parse_chain_id(std::string_view) noexcept;

ETHBRIDGE_NAMESPACE_END
