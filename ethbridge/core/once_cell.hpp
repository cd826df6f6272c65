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

#include <ethbridge/core/assert.h>
#include <ethbridge/core/config.hpp>

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

ETHBRIDGE_NAMESPACE_BEGIN

/// A cell that is written at most once between resets. Intended for values
/// derived from an owning object, which declares the cell `mutable` and
/// resets it whenever the fields the value was derived from change. Not
/// synchronized.
template <class T>
class OnceCell
{
    std::optional<T> value_{};

public:
    bool has_value() const noexcept
    {
        return value_.has_value();
    }

    T const *get() const noexcept
    {
        return value_.has_value() ? &*value_ : nullptr;
    }

    T const &set(T value)
    {
        ETHBRIDGE_ASSERT(!value_.has_value());
        return value_.emplace(std::move(value));
    }

    template <std::invocable F>
        requires std::convertible_to<std::invoke_result_t<F>, T>
    T const &get_or_init(F &&f)
    {
        if (!value_.has_value()) {
            value_.emplace(std::forward<F>(f)());
        }
        return *value_;
    }

    void reset() noexcept
    {
        value_.reset();
    }
};

ETHBRIDGE_NAMESPACE_END
