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
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

template <unsigned_integral T>
constexpr Result<T> decode_raw_num(byte_string_view const enc)
{
    if (ETHBRIDGE_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }

    if (enc.empty()) {
        return 0;
    }

    if (enc[0] == 0) {
        return DecodeError::LeadingZero;
    }

    T result{};
    std::memcpy(
        &intx::as_bytes(result)[sizeof(T) - enc.size()],
        enc.data(),
        enc.size());
    result = intx::to_big_endian(result);
    return result;
}

constexpr Result<size_t> decode_length(byte_string_view const enc)
{
    return decode_raw_num<size_t>(enc);
}

constexpr Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t length = 0;

    if (ETHBRIDGE_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (ETHBRIDGE_UNLIKELY(enc[0] >= 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0x80) // [0x00, 0x7f]
    {
        length = 1;
    }
    else if (enc[0] < 0xb8) // [0x80, 0xb7]
    {
        ++i;
        length = enc[0] - 0x80;
        // a single byte below 0x80 is its own encoding
        if (ETHBRIDGE_UNLIKELY(
                length == 1 && enc.size() > 1 && enc[1] < 0x80)) {
            return DecodeError::NonCanonical;
        }
    }
    else // [0xb8, 0xbf]
    {
        ++i;
        uint8_t const length_of_length = enc[0] - 0xb7;

        if (ETHBRIDGE_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            length, decode_length(enc.substr(i, length_of_length)));
        if (ETHBRIDGE_UNLIKELY(length < 56)) {
            return DecodeError::NonCanonical;
        }
        i += length_of_length;
    }

    if (ETHBRIDGE_UNLIKELY(length > enc.size() - i)) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, length);
    enc = enc.substr(i + length);
    return payload;
}

constexpr Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t length;
    ++i;

    if (ETHBRIDGE_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (ETHBRIDGE_UNLIKELY(enc[0] < 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0xf8) {
        length = enc[0] - 0xc0;
    }
    else {
        size_t const length_of_length = enc[0] - 0xf7;

        if (ETHBRIDGE_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            length, decode_length(enc.substr(i, length_of_length)));
        if (ETHBRIDGE_UNLIKELY(length < 56)) {
            return DecodeError::NonCanonical;
        }
        i += length_of_length;
    }

    if (ETHBRIDGE_UNLIKELY(length > enc.size() - i)) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, length);
    enc = enc.substr(i + length);
    return payload;
}

constexpr Result<byte_string_view> decode_string(byte_string_view &enc)
{
    return parse_string_metadata(enc);
}

template <size_t N>
constexpr Result<byte_string_fixed<N>>
decode_byte_string_fixed(byte_string_view &enc)
{
    byte_string_fixed<N> bsf;
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (ETHBRIDGE_UNLIKELY(payload.size() != N)) {
        return DecodeError::ArrayLengthUnexpected;
    }
    std::memcpy(bsf.data(), payload.data(), N);
    return bsf;
}

ETHBRIDGE_RLP_NAMESPACE_END
