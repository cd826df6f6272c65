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
#include <ethbridge/core/likely.h>
#include <ethbridge/execution/bridge/gas_meter.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

ETHBRIDGE_NAMESPACE_BEGIN

OutOfGas::OutOfGas(std::string descriptor)
    : descriptor_{std::move(descriptor)}
    , what_{"out of gas in location: " + descriptor_}
{
}

void GasMeter::consume(uint64_t const amount, std::string_view const descriptor)
{
    if (ETHBRIDGE_UNLIKELY(
            amount > std::numeric_limits<uint64_t>::max() - consumed_)) {
        consumed_ = std::numeric_limits<uint64_t>::max();
        throw OutOfGas{std::string{descriptor}};
    }
    consumed_ += amount;
    if (ETHBRIDGE_UNLIKELY(is_past_limit())) {
        throw OutOfGas{std::string{descriptor}};
    }
}

ETHBRIDGE_NAMESPACE_END
