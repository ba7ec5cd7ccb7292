/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parse_decimal.hpp"

#include <gtest/gtest.h>
#include <numcodec/common/constants.hpp>

using numcodec::BigInt;
using numcodec::example::parseDecimal;

TEST(ParseDecimal, Accepts) {
  EXPECT_EQ(parseDecimal("0"), BigInt{0});
  EXPECT_EQ(parseDecimal("300"), BigInt{300});
  EXPECT_EQ(parseDecimal("000"), BigInt{0});
  EXPECT_EQ(parseDecimal("010"), BigInt{10});
  EXPECT_EQ(parseDecimal("18446744073709551616"),
            BigInt{BigInt{numcodec::kU64Max} + 1});
}

/**
 * @given arguments that are not non-negative decimal numbers
 * @when they are parsed
 * @then no value is produced and nothing throws
 */
TEST(ParseDecimal, Rejects) {
  for (auto arg : {"", "-1", "abc", "12a", "0x10", " 1", "1.5"}) {
    EXPECT_EQ(parseDecimal(arg), std::nullopt) << arg;
  }
}
