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
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/bridge/rlp/embedded_batch_rlp.hpp>
#include <ethbridge/execution/ethereum/core/address.hpp>
#include <ethbridge/execution/ethereum/core/rlp/address_rlp.hpp>
#include <ethbridge/execution/ethereum/core/rlp/int_rlp.hpp>
#include <ethbridge/execution/ethereum/core/rlp/wire_transaction_rlp.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>
#include <ethbridge/execution/ethereum/rlp/decode.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>
#include <ethbridge/execution/ethereum/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <string_view>
#include <utility>
#include <variant>
#include <vector>

ETHBRIDGE_RLP_NAMESPACE_BEGIN

ETHBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

byte_string encode_entries(std::vector<TransferEntry> const &entries)
{
    byte_string payload;
    for (auto const &entry : entries) {
        payload += encode_list2(
            encode_address(entry.address), encode_unsigned(entry.amount));
    }
    return encode_list_payload(payload);
}

Result<std::vector<TransferEntry>> decode_entries(byte_string_view &enc)
{
    std::vector<TransferEntry> entries;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    while (!payload.empty()) {
        BOOST_OUTCOME_TRY(auto entry_payload, parse_list_metadata(payload));
        TransferEntry entry;
        BOOST_OUTCOME_TRY(entry.address, decode_address(entry_payload));
        BOOST_OUTCOME_TRY(
            entry.amount, decode_unsigned<uint256_t>(entry_payload));
        if (ETHBRIDGE_UNLIKELY(!entry_payload.empty())) {
            return DecodeError::InputTooLong;
        }
        entries.emplace_back(std::move(entry));
    }
    return entries;
}

ETHBRIDGE_ANONYMOUS_NAMESPACE_END

byte_string encode_embedded_message(EmbeddedMessage const &msg)
{
    auto const type = encode_string2(to_byte_string_view(message_type(msg)));
    if (auto const *const send = std::get_if<MsgSend>(&msg)) {
        return encode_list2(
            type,
            encode_address(send->from),
            encode_address(send->to),
            encode_unsigned(send->amount));
    }
    if (auto const *const multi = std::get_if<MsgMultiSend>(&msg)) {
        return encode_list2(
            type,
            encode_entries(multi->inputs),
            encode_entries(multi->outputs));
    }
    auto const &eth = std::get<MsgEthereumTx>(msg);
    return encode_list2(type, encode_wire_transaction(eth.tx));
}

byte_string encode_embedded_batch(EmbeddedBatch const &batch)
{
    byte_string messages;
    for (auto const &msg : batch.messages) {
        messages += encode_embedded_message(msg);
    }
    byte_string signatures;
    for (auto const &sig : batch.signatures) {
        signatures += encode_string2(sig);
    }
    return encode_list2(
        encode_list_payload(messages), encode_list_payload(signatures));
}

Result<EmbeddedMessage> decode_embedded_message(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    BOOST_OUTCOME_TRY(auto const type_bytes, parse_string_metadata(payload));
    auto const type = to_string_view(type_bytes);

    EmbeddedMessage msg;
    if (type == SEND_TYPE) {
        MsgSend send;
        BOOST_OUTCOME_TRY(send.from, decode_address(payload));
        BOOST_OUTCOME_TRY(send.to, decode_address(payload));
        BOOST_OUTCOME_TRY(send.amount, decode_unsigned<uint256_t>(payload));
        msg = std::move(send);
    }
    else if (type == MULTI_SEND_TYPE) {
        MsgMultiSend multi;
        BOOST_OUTCOME_TRY(multi.inputs, decode_entries(payload));
        BOOST_OUTCOME_TRY(multi.outputs, decode_entries(payload));
        msg = std::move(multi);
    }
    else if (type == ETHEREUM_TX_TYPE) {
        BOOST_OUTCOME_TRY(auto tx, decode_wire_transaction(payload));
        msg = MsgEthereumTx{.tx = std::move(tx)};
    }
    else {
        return DecodeError::InvalidMessageType;
    }

    if (ETHBRIDGE_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    return msg;
}

Result<EmbeddedBatch> decode_embedded_batch(byte_string_view &enc)
{
    EmbeddedBatch batch;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(auto messages, parse_list_metadata(payload));
    while (!messages.empty()) {
        BOOST_OUTCOME_TRY(auto msg, decode_embedded_message(messages));
        batch.messages.emplace_back(std::move(msg));
    }

    BOOST_OUTCOME_TRY(auto signatures, parse_list_metadata(payload));
    while (!signatures.empty()) {
        BOOST_OUTCOME_TRY(auto const sig, decode_string(signatures));
        batch.signatures.emplace_back(sig);
    }

    if (ETHBRIDGE_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    return batch;
}

Result<EmbeddedBatch> decode_embedded_batch(WireTransaction const &tx)
{
    byte_string_view enc{tx.data().payload};
    BOOST_OUTCOME_TRY(auto batch, decode_embedded_batch(enc));
    if (ETHBRIDGE_UNLIKELY(!enc.empty())) {
        return DecodeError::InputTooLong;
    }
    return batch;
}

ETHBRIDGE_RLP_NAMESPACE_END
