/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/varint/continuation.hpp>

#include <gtest/gtest.h>
#include <numcodec/common/constants.hpp>
#include "testutil/hex.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using numcodec::BigInt;
using numcodec::Bytes;
using numcodec::EncodingError;
using numcodec::kMaxSafeInteger;
using numcodec::kU64Max;
using testutil::hex;
using testutil::unhex;

struct ContinuationVector {
  uint64_t value;
  std::string encoded;
};

class ContinuationTest : public testing::TestWithParam<ContinuationVector> {
 public:
  static void SetUpTestSuite() {
    testutil::prepareLoggers(soralog::Level::TRACE);
  }
};

/**
 * @given a value with its encoding in the reference format
 * @when it is encoded and the reference bytes are decoded
 * @then both directions agree with the reference
 */
TEST_P(ContinuationTest, ReferenceVector) {
  const auto &[value, encoded] = GetParam();
  const auto reference = unhex(encoded);

  Bytes buffer(reference.size());
  ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2(buffer, value, 0));
  EXPECT_EQ(end, reference.size());
  EXPECT_EQ(hex(buffer), encoded);
  EXPECT_EQ(numcodec::sizeVarint2(value), reference.size());

  ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2(reference, 0));
  EXPECT_EQ(decoded.size, reference.size());
  EXPECT_EQ(decoded.value, value);

  ASSERT_OUTCOME_SUCCESS(skipped, numcodec::skipVarint2(reference, 0));
  EXPECT_EQ(skipped, reference.size());

  ASSERT_OUTCOME_SUCCESS(decoded_bn, numcodec::readVarint2BN(reference, 0));
  EXPECT_EQ(decoded_bn.size, reference.size());
  EXPECT_EQ(decoded_bn.value, BigInt{value});
}

INSTANTIATE_TEST_SUITE_P(
    ContinuationVectors,
    ContinuationTest,
    testing::Values(ContinuationVector{0, "00"},
                    ContinuationVector{0x7f, "7f"},
                    ContinuationVector{0x80, "8000"},
                    ContinuationVector{0x1234, "a334"},
                    ContinuationVector{16511, "ff7f"},
                    ContinuationVector{16512, "808000"},
                    ContinuationVector{0xffff, "82fe7f"},
                    ContinuationVector{0x123456, "c7e756"},
                    ContinuationVector{0x80123456, "86ffc7e756"},
                    ContinuationVector{0xffffffff, "8efefefe7f"}));

/**
 * @given every value from 0 to 10^6
 * @when it is encoded and decoded
 * @then the value survives and the consumed size equals the computed size
 */
TEST(Continuation, DenseRoundTrip) {
  Bytes buffer(4);
  for (uint64_t n = 0; n <= 1'000'000; ++n) {
    ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2(buffer, n, 0));
    ASSERT_EQ(end, numcodec::sizeVarint2(n)) << n;
    ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2(buffer, 0));
    ASSERT_EQ(decoded.value, n);
    ASSERT_EQ(decoded.size, end) << n;
  }
}

TEST(Continuation, SizeBoundaries) {
  EXPECT_EQ(numcodec::sizeVarint2(0), 1u);
  EXPECT_EQ(numcodec::sizeVarint2(127), 1u);
  EXPECT_EQ(numcodec::sizeVarint2(128), 2u);
  EXPECT_EQ(numcodec::sizeVarint2(16511), 2u);
  EXPECT_EQ(numcodec::sizeVarint2(16512), 3u);
  EXPECT_EQ(numcodec::sizeVarint2(kMaxSafeInteger), 8u);
}

TEST(Continuation, EmptyAndTruncated) {
  Bytes empty;
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2(empty, 0),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2BN(empty, 0),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_ERROR(numcodec::skipVarint2(empty, 0),
                       EncodingError::OUT_OF_BOUNDS);

  auto truncated = unhex("8080");
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2(truncated, 0),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2BN(truncated, 0),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_ERROR(numcodec::skipVarint2(truncated, 0),
                       EncodingError::OUT_OF_BOUNDS);

  auto complete = unhex("808000");
  ASSERT_OUTCOME_SUCCESS(skipped, numcodec::skipVarint2(complete, 0));
  EXPECT_EQ(skipped, 3u);
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2(complete, 3),
                       EncodingError::OUT_OF_BOUNDS);
}

/**
 * @given a buffer one byte shorter than the encoding
 * @when the value is written
 * @then the write fails with OUT_OF_BOUNDS and nothing is written
 */
TEST(Continuation, WriteOutOfBounds) {
  Bytes buffer(3);
  EXPECT_OUTCOME_ERROR(numcodec::writeVarint2(buffer, 16512, 1),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_ERROR(numcodec::writeVarint2(buffer, 0, 3),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_OUTCOME_ERROR(numcodec::writeVarint2BN(buffer, kU64Max, 0),
                       EncodingError::OUT_OF_BOUNDS);
  EXPECT_EQ(hex(buffer), "000000");

  ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2(buffer, 16512, 0));
  EXPECT_EQ(end, 3u);
  EXPECT_EQ(hex(buffer), "808000");
}

TEST(Continuation, NativeRange) {
  Bytes buffer(10);
  EXPECT_OUTCOME_ERROR(numcodec::writeVarint2(buffer, kMaxSafeInteger + 1, 0),
                       EncodingError::NUMBER_EXCEEDS_53_BITS);

  // the accumulator leaves the safe range before the last digit
  auto max64 = unhex("80fefefefefefefefe7f");
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2(max64, 0),
                       EncodingError::NUMBER_EXCEEDS_53_BITS);

  constexpr uint64_t kWide = (uint64_t{1} << 42) - 1;
  ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2(buffer, kWide, 0));
  ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2(buffer, 0));
  EXPECT_EQ(decoded.value, kWide);
  EXPECT_EQ(decoded.size, end);
}

/**
 * @given the largest safe integers, whose last digit lands at the ceiling
 * @when they are encoded and decoded natively
 * @then they round-trip, while 2^53 is refused
 */
TEST(Continuation, SafeCeiling) {
  for (uint64_t v :
       {kMaxSafeInteger, kMaxSafeInteger - 127, kMaxSafeInteger - 128}) {
    Bytes buffer(8);
    ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2(buffer, v, 0));
    EXPECT_EQ(end, 8u);
    ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2(buffer, 0));
    EXPECT_EQ(decoded.value, v);
    EXPECT_EQ(decoded.size, 8u);
  }

  auto max_safe = unhex("8efefefefefefe7f");
  ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2(max_safe, 0));
  EXPECT_EQ(decoded.value, kMaxSafeInteger);

  auto first_unsafe = unhex("8efefefefefeff00");
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2(first_unsafe, 0),
                       EncodingError::NUMBER_EXCEEDS_53_BITS);
}

/**
 * @given values past 2^53 with their reference encodings
 * @when they go through the big-integer encoder and decoder
 * @then the bytes and values match
 */
TEST(Continuation, BigIntReference) {
  const std::vector<std::pair<BigInt, std::string>> vectors{
      {BigInt{kMaxSafeInteger} + 1, "8efefefefefeff00"},
      {BigInt{std::numeric_limits<int64_t>::max()}, "fefefefefefefefe7f"},
      {kU64Max, "80fefefefefefefefe7f"},
  };
  for (const auto &[value, encoded] : vectors) {
    Bytes buffer(10);
    ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2BN(buffer, value, 0));
    buffer.resize(end);
    EXPECT_EQ(hex(buffer), encoded);
    ASSERT_OUTCOME_SUCCESS(size, numcodec::sizeVarint2BN(value));
    EXPECT_EQ(size, end);

    ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2BN(buffer, 0));
    EXPECT_EQ(decoded.value, value);
    EXPECT_EQ(decoded.size, end);
  }
}

TEST(Continuation, BigIntDelegatesToNative) {
  Bytes buffer(4);
  ASSERT_OUTCOME_SUCCESS(end, numcodec::writeVarint2BN(buffer, BigInt{128}, 2));
  EXPECT_EQ(end, 4u);
  EXPECT_EQ(hex(buffer), "00008000");

  ASSERT_OUTCOME_SUCCESS(size, numcodec::sizeVarint2BN(BigInt{16512}));
  EXPECT_EQ(size, 3u);
}

TEST(Continuation, BigIntOutOfRange) {
  // the prefix is already wider than 64 bits when the last digit arrives
  auto wide = unhex("80fefefefefefefefeff00");
  EXPECT_OUTCOME_ERROR(numcodec::readVarint2BN(wide, 0),
                       EncodingError::NUMBER_EXCEEDS_64_BITS);

  Bytes buffer(10);
  EXPECT_OUTCOME_ERROR(numcodec::writeVarint2BN(buffer, BigInt{-1}, 0),
                       EncodingError::NEGATIVE_NUMBER);
  EXPECT_OUTCOME_ERROR(numcodec::sizeVarint2BN(BigInt{-1}),
                       EncodingError::NEGATIVE_NUMBER);
}

TEST(Continuation, Sequential) {
  const std::vector<uint64_t> values{0, 127, 128, 16511, 16512, 1'000'000};
  Bytes buffer(16);
  size_t off = 0;
  for (auto v : values) {
    ASSERT_OUTCOME_SUCCESS(next, numcodec::writeVarint2(buffer, v, off));
    off = next;
  }
  EXPECT_EQ(off, 1u + 1 + 2 + 2 + 3 + 3);

  off = 0;
  for (auto v : values) {
    ASSERT_OUTCOME_SUCCESS(decoded, numcodec::readVarint2(buffer, off));
    EXPECT_EQ(decoded.value, v);
    off += decoded.size;
  }
}
