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
#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/ethereum/rlp/decode.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>
#include <ethbridge/execution/ethereum/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <limits>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

inline byte_string encode_unsigned(unsigned_integral auto const &n)
{
    return encode_string2(to_big_compact(n));
}

template <unsigned_integral T>
constexpr Result<T> decode_unsigned(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    return decode_raw_num<T>(payload);
}

// Non-negative signed values are carried as their unsigned magnitude
inline byte_string encode_signed(int64_t const n)
{
    ETHBRIDGE_ASSERT(n >= 0);
    return encode_unsigned(static_cast<uint64_t>(n));
}

inline Result<int64_t> decode_signed(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const n, decode_unsigned<uint64_t>(enc));
    if (ETHBRIDGE_UNLIKELY(
            n > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
        return DecodeError::Overflow;
    }
    return static_cast<int64_t>(n);
}

ETHBRIDGE_RLP_NAMESPACE_END
