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

#include <ethbridge/core/byte_string.hpp>
#include <ethbridge/core/int.hpp>
#include <ethbridge/core/likely.h>
#include <ethbridge/core/result.hpp>
#include <ethbridge/core/rlp/config.hpp>
#include <ethbridge/execution/ethereum/core/rlp/address_rlp.hpp>
#include <ethbridge/execution/ethereum/core/rlp/int_rlp.hpp>
#include <ethbridge/execution/ethereum/core/rlp/wire_transaction_rlp.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>
#include <ethbridge/execution/ethereum/rlp/decode.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>
#include <ethbridge/execution/ethereum/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <utility>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

namespace
{
    byte_string encode_legacy_base(TxData const &data)
    {
        byte_string encoding{};

        encoding += encode_unsigned(data.nonce);
        encoding += encode_unsigned(data.gas_price);
        encoding += encode_unsigned(data.gas_limit);
        encoding += encode_address(data.recipient);
        encoding += encode_unsigned(data.amount);
        encoding += encode_string2(data.payload);

        return encoding;
    }
}

byte_string encode_wire_transaction(WireTransaction const &tx)
{
    auto const &data = tx.data();
    return encode_list2(
        encode_legacy_base(data),
        encode_unsigned(data.v),
        encode_unsigned(data.r),
        encode_unsigned(data.s));
}

byte_string encode_wire_transaction_for_signing(
    TxData const &data, uint256_t const &chain_id)
{
    if (chain_id == 0) {
        return encode_list2(encode_legacy_base(data));
    }
    return encode_list2(
        encode_legacy_base(data),
        encode_unsigned(chain_id),
        encode_unsigned(0u),
        encode_unsigned(0u));
}

Result<WireTransaction> decode_wire_transaction(byte_string_view &enc)
{
    TxData data;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(data.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(data.gas_price, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(data.gas_limit, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(data.recipient, decode_optional_address(payload));
    BOOST_OUTCOME_TRY(data.amount, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(data.payload, decode_string(payload));
    BOOST_OUTCOME_TRY(data.v, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(data.r, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(data.s, decode_unsigned<uint256_t>(payload));

    if (ETHBRIDGE_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return WireTransaction{std::move(data)};
}

ETHBRIDGE_RLP_NAMESPACE_END
