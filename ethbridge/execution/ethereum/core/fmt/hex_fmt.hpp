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

#include <ethbridge/core/basic_formatter.hpp>
#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <span>

ETHBRIDGE_NAMESPACE_BEGIN

// Prints fixed-width byte arrays as 0x-prefixed lowercase hex
template <class T>
struct FixedBytesFormatter : public BasicFormatter
{
    template <typename FormatContext>
    auto format(T const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "0x{:02x}",
            fmt::join(std::as_bytes(std::span(value.bytes)), ""));
        return ctx.out();
    }
};

ETHBRIDGE_NAMESPACE_END

template <>
struct quill::copy_loggable<ethbridge::Address> : std::true_type
{
};

template <>
struct quill::copy_loggable<ethbridge::bytes32_t> : std::true_type
{
};

template <>
struct fmt::formatter<ethbridge::Address>
    : public ethbridge::FixedBytesFormatter<ethbridge::Address>
{
};

template <>
struct fmt::formatter<ethbridge::bytes32_t>
    : public ethbridge::FixedBytesFormatter<ethbridge::bytes32_t>
{
};
