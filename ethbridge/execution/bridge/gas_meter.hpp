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

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

ETHBRIDGE_NAMESPACE_BEGIN

struct GasConfig
{
    uint64_t sig_verify_cost{100};
    uint64_t has_cost{10};
    uint64_t read_cost_flat{10};
    uint64_t read_cost_per_byte{1};
    uint64_t write_cost_flat{10};
    uint64_t write_cost_per_byte{10};
};

/// Thrown by GasMeter::consume once the limit is exceeded. Only the ante
/// handler catches it.
class OutOfGas : public std::exception
{
    std::string descriptor_;
    std::string what_;

public:
    explicit OutOfGas(std::string descriptor);

    std::string const &descriptor() const noexcept
    {
        return descriptor_;
    }

    char const *what() const noexcept override
    {
        return what_.c_str();
    }
};

class GasMeter
{
    std::optional<uint64_t> limit_{};
    uint64_t consumed_{0};

public:
    // no limit
    GasMeter() = default;

    explicit GasMeter(uint64_t limit)
        : limit_{limit}
    {
    }

    std::optional<uint64_t> limit() const noexcept
    {
        return limit_;
    }

    uint64_t consumed() const noexcept
    {
        return consumed_;
    }

    bool is_past_limit() const noexcept
    {
        return limit_.has_value() && consumed_ > *limit_;
    }

    /// Records `amount`, saturating on overflow; throws OutOfGas when the
    /// total then exceeds the limit
    void consume(uint64_t amount, std::string_view descriptor);
};

ETHBRIDGE_NAMESPACE_END
