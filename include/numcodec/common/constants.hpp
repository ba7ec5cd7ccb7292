/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <numcodec/common/types.hpp>

namespace numcodec {
  constexpr uint64_t kU32Max = 0xffffffff;

  /// Largest integer a safe native path is allowed to produce or accept
  constexpr uint64_t kMaxSafeInteger = 0x1fffffffffffff;

  /// Largest integer whose doubling stays below `kMaxSafeInteger`
  constexpr uint64_t kMaxSafeAddition = 0xfffffffffffff;

  /// Bits of a native safe integer
  constexpr size_t kSafeBits = 53;

  /// Any of these bits set in the high word means the value is >= 2^53
  constexpr uint32_t kUnsafeHighMask = 0xffe00000;

  /// High word bits kept by the truncating 53-bit readers
  constexpr uint32_t kSafeHighMask = 0x1fffff;

  /// Bits a big-integer continuation accumulator may hold before each digit
  constexpr size_t kMaxAccumulatorBits = 64;

  inline const BigInt kU64Max{std::numeric_limits<uint64_t>::max()};
}  // namespace numcodec
