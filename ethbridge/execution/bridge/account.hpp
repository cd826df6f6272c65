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
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <cstdint>

ETHBRIDGE_NAMESPACE_BEGIN

struct Account
{
    Address address{};
    int64_t account_number{0};
    // authorizes embedded batch signatures, independent of the wire nonce
    int64_t sequence{0};

    friend bool operator==(Account const &, Account const &) = default;
};

ETHBRIDGE_NAMESPACE_END
