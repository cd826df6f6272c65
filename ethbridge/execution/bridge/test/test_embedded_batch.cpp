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
#include <ethbridge/core/bytes.hpp>
#include <ethbridge/core/keccak.hpp>
#include <ethbridge/execution/bridge/embedded_batch.hpp>
#include <ethbridge/execution/bridge/embedded_message.hpp>
#include <ethbridge/execution/bridge/rlp/embedded_batch_rlp.hpp>
#include <ethbridge/execution/ethereum/core/ecdsa.hpp>
#include <ethbridge/execution/ethereum/core/wire_transaction.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>
#include <ethbridge/execution/ethereum/rlp/encode2.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace ethbridge;
using namespace ethbridge::rlp;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto a{0x00000000000000000000000000000000000000aa_address};
    constexpr auto b{0x00000000000000000000000000000000000000bb_address};
    constexpr auto c{0x00000000000000000000000000000000000000cc_address};

    constexpr auto secret_key{
        0x4646464646464646464646464646464646464646464646464646464646464646_bytes32};
    constexpr auto secret_key_address{
        0x9d8A62f656a8d1615C1294fd71e9CFb3E4855A4F_address};

    MsgMultiSend multi_send(std::vector<TransferEntry> inputs)
    {
        uint256_t total{0};
        for (auto const &input : inputs) {
            total += input.amount;
        }
        return MsgMultiSend{
            .inputs = std::move(inputs),
            .outputs = {TransferEntry{.address = c, .amount = total}}};
    }
}

TEST(EmbeddedBatch, required_signers_keep_first_occurrence)
{
    EmbeddedBatch const batch{
        .messages = {
            multi_send(
                {{.address = a, .amount = 1}, {.address = b, .amount = 1}}),
            multi_send(
                {{.address = b, .amount = 1}, {.address = c, .amount = 1}}),
        }};
    EXPECT_EQ(batch.required_signers(), (std::vector<Address>{a, b, c}));
}

TEST(EmbeddedBatch, message_signers)
{
    EXPECT_EQ(
        message_signers(MsgSend{.from = b, .to = a, .amount = 1}),
        std::vector<Address>{b});
    EXPECT_TRUE(message_signers(MsgEthereumTx{}).empty());
    EXPECT_EQ(message_type(MsgSend{}), "send");
    EXPECT_EQ(message_type(MsgMultiSend{}), "multisend");
    EXPECT_EQ(message_type(MsgEthereumTx{}), "Ethereum");
}

TEST(EmbeddedBatch, sign_bytes_layout)
{
    EmbeddedBatch const batch{
        .messages = {MsgSend{.from = a, .to = b, .amount = 10}}};

    EXPECT_EQ(
        embedded_sign_bytes(batch, "2", 3, 7),
        R"({"accountNumber":3,"chainId":"2","msgs":[)"
        R"({"amount":"10",)"
        R"("from":"0x00000000000000000000000000000000000000aa",)"
        R"("to":"0x00000000000000000000000000000000000000bb","type":"send"})"
        R"(],"sequence":7})");

    EXPECT_EQ(
        embedded_sign_bytes(EmbeddedBatch{}, "test\"chain", 0, 0),
        R"({"accountNumber":0,"chainId":"test\"chain",)"
        R"("msgs":[],"sequence":0})");
}

TEST(EmbeddedBatch, multi_send_sign_bytes)
{
    EmbeddedMessage const msg = MsgMultiSend{
        .inputs = {{.address = a, .amount = 5}},
        .outputs = {{.address = b, .amount = 2}, {.address = c, .amount = 3}}};

    EXPECT_EQ(
        message_sign_bytes(msg),
        R"({"inputs":[)"
        R"({"address":"0x00000000000000000000000000000000000000aa",)"
        R"("amount":"5"}],)"
        R"("outputs":[)"
        R"({"address":"0x00000000000000000000000000000000000000bb",)"
        R"("amount":"2"},)"
        R"({"address":"0x00000000000000000000000000000000000000cc",)"
        R"("amount":"3"}],)"
        R"("type":"multisend"})");
}

TEST(EmbeddedBatch, sign_embedded_batch)
{
    EmbeddedBatch const batch{
        .messages = {
            MsgSend{.from = secret_key_address, .to = b, .amount = 1}}};

    auto const sig = sign_embedded_batch(batch, "2", 0, 4, secret_key);
    ASSERT_TRUE(sig.has_value());
    ASSERT_EQ(sig->size(), COMPACT_SIGNATURE_SIZE);

    auto const recoverable = from_compact(*sig);
    ASSERT_TRUE(recoverable.has_value());
    auto const digest = to_bytes(
        keccak256(to_byte_string_view(embedded_sign_bytes(batch, "2", 0, 4))));
    EXPECT_EQ(recover_address(digest, *recoverable), secret_key_address);

    // sequence is part of the document
    auto const other = to_bytes(
        keccak256(to_byte_string_view(embedded_sign_bytes(batch, "2", 0, 5))));
    EXPECT_NE(recover_address(other, *recoverable), secret_key_address);

    EXPECT_FALSE(
        sign_embedded_batch(batch, "2", 0, 4, bytes32_t{}).has_value());
}

TEST(EmbeddedMessage, validate_send)
{
    EXPECT_FALSE(
        validate_message(MsgSend{.from = a, .to = b, .amount = 1}).has_error());

    auto const zero =
        validate_message(MsgSend{.from = a, .to = b, .amount = 0});
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.error(), MessageError::NonPositiveAmount);

    auto const self =
        validate_message(MsgSend{.from = a, .to = a, .amount = 1});
    ASSERT_TRUE(self.has_error());
    EXPECT_EQ(self.error(), MessageError::SelfTransfer);
}

TEST(EmbeddedMessage, validate_multi_send)
{
    EXPECT_FALSE(validate_message(multi_send({{.address = a, .amount = 2},
                                              {.address = b, .amount = 3}}))
                     .has_error());

    auto const no_inputs = validate_message(
        MsgMultiSend{.outputs = {{.address = c, .amount = 1}}});
    ASSERT_TRUE(no_inputs.has_error());
    EXPECT_EQ(no_inputs.error(), MessageError::NoInputs);

    auto const no_outputs = validate_message(
        MsgMultiSend{.inputs = {{.address = a, .amount = 1}}});
    ASSERT_TRUE(no_outputs.has_error());
    EXPECT_EQ(no_outputs.error(), MessageError::NoOutputs);

    auto const zero = validate_message(MsgMultiSend{
        .inputs = {{.address = a, .amount = 0}},
        .outputs = {{.address = c, .amount = 0}}});
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.error(), MessageError::NonPositiveAmount);

    auto const mismatch = validate_message(MsgMultiSend{
        .inputs = {{.address = a, .amount = 2}},
        .outputs = {{.address = c, .amount = 3}}});
    ASSERT_TRUE(mismatch.has_error());
    EXPECT_EQ(mismatch.error(), MessageError::InputOutputMismatch);

    // sums are compared without wrapping
    auto const wrapped = validate_message(MsgMultiSend{
        .inputs =
            {{.address = a, .amount = UINT256_MAX},
             {.address = b, .amount = 2}},
        .outputs = {{.address = c, .amount = 1}}});
    ASSERT_TRUE(wrapped.has_error());
    EXPECT_EQ(wrapped.error(), MessageError::InputOutputMismatch);
}

TEST(Rlp_EmbeddedBatch, encode_decode)
{
    WireTransaction nested{TxData{
        .nonce = 1,
        .gas_price = 2,
        .gas_limit = 3,
        .recipient = a,
        .amount = 4,
        .payload = to_byte_string("nested")}};
    EmbeddedBatch const batch{
        .messages =
            {MsgSend{.from = a, .to = b, .amount = 0x1234_u256},
             multi_send({{.address = a, .amount = 1}}),
             MsgEthereumTx{.tx = std::move(nested)}},
        .signatures = {byte_string(65, 0x01), byte_string(65, 0x02)}};

    auto const encoded = encode_embedded_batch(batch);
    byte_string_view enc{encoded};
    auto const decoded = decode_embedded_batch(enc);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_TRUE(enc.empty());
    EXPECT_EQ(decoded.value(), batch);
}

TEST(Rlp_EmbeddedBatch, encode_send)
{
    EmbeddedMessage const msg = MsgSend{.from = a, .to = b, .amount = 10};
    byte_string const expected =
        evmc::from_hex("0xf0"
                       "8473656e64"
                       "9400000000000000000000000000000000000000aa"
                       "9400000000000000000000000000000000000000bb"
                       "0a")
            .value();
    EXPECT_EQ(encode_embedded_message(msg), expected);
}

TEST(Rlp_EmbeddedBatch, empty_batch)
{
    auto const encoded = encode_embedded_batch(EmbeddedBatch{});
    EXPECT_EQ(encoded, byte_string({0xc2, 0xc0, 0xc0}));

    WireTransaction const tx{TxData{.payload = encoded}};
    auto const decoded = decode_embedded_batch(tx);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_TRUE(decoded.value().messages.empty());
    EXPECT_TRUE(decoded.value().signatures.empty());
}

TEST(Rlp_EmbeddedBatch, decode_errors)
{
    {
        // unknown message type
        auto const encoded = encode_list2(
            encode_list2(encode_list2(
                encode_string2(to_byte_string_view("bogus")),
                encode_unsigned(1u))),
            encode_list2());
        byte_string_view enc{encoded};
        auto const res = decode_embedded_batch(enc);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), DecodeError::InvalidMessageType);
    }
    {
        // extra field in a send
        auto const encoded = encode_list2(
            encode_list2(encode_list2(
                encode_string2(to_byte_string_view("send")),
                encode_string2(to_byte_string_view(a.bytes)),
                encode_string2(to_byte_string_view(b.bytes)),
                encode_unsigned(1u),
                encode_unsigned(1u))),
            encode_list2());
        byte_string_view enc{encoded};
        auto const res = decode_embedded_batch(enc);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), DecodeError::InputTooLong);
    }
    {
        // signatures missing
        auto const encoded = encode_list2(encode_list2());
        byte_string_view enc{encoded};
        auto const res = decode_embedded_batch(enc);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), DecodeError::InputTooShort);
    }
    {
        WireTransaction const tx{
            TxData{.payload = to_byte_string("My test bytes")}};
        auto const res = decode_embedded_batch(tx);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), DecodeError::TypeUnexpected);
    }
    {
        // trailing bytes after the batch
        auto payload = encode_embedded_batch(EmbeddedBatch{});
        payload.push_back(0x80);
        WireTransaction const tx{TxData{.payload = payload}};
        auto const res = decode_embedded_batch(tx);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), DecodeError::InputTooLong);
    }
    {
        WireTransaction const tx{};
        auto const res = decode_embedded_batch(tx);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), DecodeError::InputTooShort);
    }
}
