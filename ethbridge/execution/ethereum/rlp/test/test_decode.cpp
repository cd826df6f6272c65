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
#include <ethbridge/execution/ethereum/rlp/decode.hpp>
#include <ethbridge/execution/ethereum/rlp/decode_error.hpp>
#include <ethbridge/execution/ethereum/rlp/encode2.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace ethbridge;
using namespace ethbridge::rlp;

TEST(Rlp, DecodeAfterEncodeString)
{
    {
        std::string const empty_string = "";
        auto encoding = encode_string2(to_byte_string_view(empty_string));

        byte_string_view encoded_string_view{encoding};
        auto const decoded_string = decode_string(encoded_string_view);
        ASSERT_FALSE(decoded_string.has_error());
        EXPECT_EQ(encoded_string_view.size(), 0);
        EXPECT_EQ(decoded_string.value(), to_byte_string_view(empty_string));
    }

    {
        std::string const short_string = "hello world";
        auto encoding = encode_string2(to_byte_string_view(short_string));

        byte_string_view encoded_string_view{encoding};
        auto const decoded_string = decode_string(encoded_string_view);
        ASSERT_FALSE(decoded_string.has_error());
        EXPECT_EQ(encoded_string_view.size(), 0);
        EXPECT_EQ(decoded_string.value(), to_byte_string_view(short_string));
    }

    {
        std::string const long_string =
            "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
        auto encoding = encode_string2(to_byte_string_view(long_string));

        byte_string_view encoded_string_view2{encoding};
        auto const decoded_string = decode_string(encoded_string_view2);
        ASSERT_FALSE(decoded_string.has_error());
        EXPECT_EQ(encoded_string_view2.size(), 0);
        EXPECT_EQ(decoded_string.value(), to_byte_string_view(long_string));
    }
}

TEST(Rlp, DecodeRawNum)
{
    EXPECT_EQ(decode_raw_num<uint64_t>(byte_string_view{}).value(), 0);
    EXPECT_EQ(
        decode_raw_num<uint64_t>(byte_string({0x04, 0x00})).value(), 1024);
    EXPECT_EQ(
        decode_raw_num<uint256_t>(byte_string({0x01, 0x00, 0x00})).value(),
        65536);

    auto const leading_zero =
        decode_raw_num<uint64_t>(byte_string({0x00, 0x01}));
    ASSERT_TRUE(leading_zero.has_error());
    EXPECT_EQ(leading_zero.error(), DecodeError::LeadingZero);

    auto const overflow = decode_raw_num<uint8_t>(byte_string({0x01, 0x00}));
    ASSERT_TRUE(overflow.has_error());
    EXPECT_EQ(overflow.error(), DecodeError::Overflow);
}

TEST(Rlp, DecodeList)
{
    byte_string const encoding{0xc8, 0x83, 'c', 'a', 't', 0x83, 'd', 'o', 'g'};
    byte_string_view enc{encoding};

    auto payload = parse_list_metadata(enc);
    ASSERT_FALSE(payload.has_error());
    EXPECT_TRUE(enc.empty());

    auto const cat = decode_string(payload.value());
    ASSERT_FALSE(cat.has_error());
    EXPECT_EQ(cat.value(), to_byte_string_view("cat"));
    auto const dog = decode_string(payload.value());
    ASSERT_FALSE(dog.has_error());
    EXPECT_EQ(dog.value(), to_byte_string_view("dog"));
    EXPECT_TRUE(payload.value().empty());
}

TEST(Rlp, DecodeTypeMismatch)
{
    byte_string const list{0xc0};
    byte_string_view enc{list};
    auto const as_string = parse_string_metadata(enc);
    ASSERT_TRUE(as_string.has_error());
    EXPECT_EQ(as_string.error(), DecodeError::TypeUnexpected);

    byte_string const string{0x83, 'c', 'a', 't'};
    byte_string_view enc2{string};
    auto const as_list = parse_list_metadata(enc2);
    ASSERT_TRUE(as_list.has_error());
    EXPECT_EQ(as_list.error(), DecodeError::TypeUnexpected);
}

TEST(Rlp, DecodeTruncated)
{
    byte_string const short_string{0x83, 'c', 'a'};
    byte_string_view enc{short_string};
    auto const res = decode_string(enc);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DecodeError::InputTooShort);

    byte_string const short_list{0xc3, 0x01};
    byte_string_view enc2{short_list};
    auto const res2 = parse_list_metadata(enc2);
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.error(), DecodeError::InputTooShort);

    byte_string_view empty{};
    auto const res3 = decode_string(empty);
    ASSERT_TRUE(res3.has_error());
    EXPECT_EQ(res3.error(), DecodeError::InputTooShort);
}

TEST(Rlp, DecodeNonCanonical)
{
    // single byte below 0x80 wrapped in a string header
    byte_string const wrapped_byte{0x81, 0x05};
    byte_string_view enc{wrapped_byte};
    auto const res = decode_string(enc);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DecodeError::NonCanonical);

    // long form used for a short string
    byte_string const long_form{0xb8, 0x03, 'c', 'a', 't'};
    byte_string_view enc2{long_form};
    auto const res2 = decode_string(enc2);
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.error(), DecodeError::NonCanonical);

    // long form used for a short list
    byte_string const long_list{0xf8, 0x01, 0x01};
    byte_string_view enc3{long_list};
    auto const res3 = parse_list_metadata(enc3);
    ASSERT_TRUE(res3.has_error());
    EXPECT_EQ(res3.error(), DecodeError::NonCanonical);
}

TEST(Rlp, DecodeFixed)
{
    byte_string const encoding{0x82, 0xab, 0xcd};
    byte_string_view enc{encoding};
    auto const ok = decode_byte_string_fixed<2>(enc);
    ASSERT_FALSE(ok.has_error());
    EXPECT_EQ(ok.value()[0], 0xab);
    EXPECT_EQ(ok.value()[1], 0xcd);

    byte_string_view enc2{encoding};
    auto const wrong = decode_byte_string_fixed<3>(enc2);
    ASSERT_TRUE(wrong.has_error());
    EXPECT_EQ(wrong.error(), DecodeError::ArrayLengthUnexpected);
}
