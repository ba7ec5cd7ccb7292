/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/log/logger.hpp>

#include <gtest/gtest.h>
#include <numcodec/common/error.hpp>
#include "testutil/prepare_loggers.hpp"

using numcodec::EncodingError;
using numcodec::FaultKind;

TEST(Logger, CreateInGroup) {
  testutil::prepareLoggers(soralog::Level::DEBUG);
  auto logger = numcodec::log::createLogger("LoggerTest");
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->level(), soralog::Level::DEBUG);
  EXPECT_FALSE(numcodec::log::setLevelOfGroup("no-such-group",
                                              soralog::Level::TRACE));
}

TEST(CodecErrors, FaultKind) {
  EXPECT_EQ(numcodec::faultKind(EncodingError::OUT_OF_BOUNDS),
            FaultKind::BOUNDS);
  for (auto e : {EncodingError::NUMBER_EXCEEDS_53_BITS,
                 EncodingError::NON_CANONICAL_VARINT,
                 EncodingError::NUMBER_EXCEEDS_64_BITS,
                 EncodingError::NEGATIVE_NUMBER}) {
    EXPECT_EQ(numcodec::faultKind(e), FaultKind::RANGE);
  }
}

TEST(CodecErrors, ErrorCode) {
  std::error_code ec = EncodingError::NON_CANONICAL_VARINT;
  EXPECT_TRUE(ec);
  EXPECT_NE(ec, std::error_code{EncodingError::OUT_OF_BOUNDS});
  EXPECT_FALSE(ec.message().empty());
}
