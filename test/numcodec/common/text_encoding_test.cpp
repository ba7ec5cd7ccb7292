/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/common/text_encoding.hpp>

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using numcodec::byteLength;
using numcodec::TextEncoding;
using numcodec::TextEncodingError;

TEST(TextEncoding, Utf8) {
  EXPECT_EQ(byteLength("", TextEncoding::UTF8), 0u);
  EXPECT_EQ(byteLength("hello", TextEncoding::UTF8), 5u);
  EXPECT_EQ(byteLength("h\xc3\xa9llo", TextEncoding::UTF8), 6u);
}

/**
 * @given text with a two-byte and a four-byte UTF-8 sequence
 * @when its length is measured in single-byte and UTF-16 encodings
 * @then each code unit counts once, the four-byte sequence counts as a
 * surrogate pair
 */
TEST(TextEncoding, CodeUnits) {
  constexpr std::string_view kText = "h\xc3\xa9" "\xf0\x9f\x98\x80";
  EXPECT_EQ(byteLength(kText, TextEncoding::LATIN1), 4u);
  EXPECT_EQ(byteLength(kText, TextEncoding::ASCII), 4u);
  EXPECT_EQ(byteLength(kText, TextEncoding::UTF16LE), 8u);
}

TEST(TextEncoding, Hex) {
  EXPECT_EQ(byteLength("abcdef", TextEncoding::HEX), 3u);
  EXPECT_EQ(byteLength("abcdef0", TextEncoding::HEX), 3u);
}

TEST(TextEncoding, Base64) {
  EXPECT_EQ(byteLength("aGVsbG8=", TextEncoding::BASE64), 5u);
  EXPECT_EQ(byteLength("aGk=", TextEncoding::BASE64), 2u);
  EXPECT_EQ(byteLength("aA==", TextEncoding::BASE64), 1u);
  EXPECT_EQ(byteLength("aGV5", TextEncoding::BASE64), 3u);
  EXPECT_EQ(byteLength("", TextEncoding::BASE64), 0u);
}

TEST(TextEncoding, FromName) {
  ASSERT_OUTCOME_SUCCESS(utf8, numcodec::textEncodingFromName("UTF-8"));
  EXPECT_EQ(utf8, TextEncoding::UTF8);
  ASSERT_OUTCOME_SUCCESS(binary, numcodec::textEncodingFromName("binary"));
  EXPECT_EQ(binary, TextEncoding::LATIN1);
  ASSERT_OUTCOME_SUCCESS(ucs2, numcodec::textEncodingFromName("ucs2"));
  EXPECT_EQ(ucs2, TextEncoding::UTF16LE);
  EXPECT_OUTCOME_ERROR(numcodec::textEncodingFromName("ebcdic"),
                       TextEncodingError::UNKNOWN_ENCODING);
}
