/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <bit>
#include <numcodec/common/constants.hpp>
#include <numcodec/common/error.hpp>
#include <numcodec/fixed/fixed64.hpp>

namespace numcodec {

  /// Number of significant bits of the magnitude, 0 for zero
  inline size_t bitLength(uint64_t num) {
    return static_cast<size_t>(std::bit_width(num));
  }

  inline size_t bitLength(const BigInt &num) {
    if (num.is_zero()) {
      return 0;
    }
    const BigInt magnitude = boost::multiprecision::abs(num);
    return boost::multiprecision::msb(magnitude) + 1;
  }

  /**
   * Numeric representation used by the varint algorithms.
   *
   * A specialisation provides:
   * - construction from and narrowing to a 32-bit value,
   * - sign and bit length queries,
   * - 7-bit digit access: `low7`, `shiftIn7` (n = n * 128 + d),
   *   `shiftOut7` (n = n / 128),
   * - add/subtract of a small value and comparison with a small value,
   * - 8-byte little-endian (de)serialization,
   * - the ceilings a decoder checks before folding in a digit (`canShiftIn`)
   *   and before adding the continuation offset (`canAdd`).
   */
  template <typename T>
  struct NumericRepr;

  /**
   * Native safe integer.
   * Values never exceed 2^53-1; the 8-byte codec and the accumulator enforce
   * it.
   */
  template <>
  struct NumericRepr<uint64_t> {
    using Value = uint64_t;

    static constexpr EncodingError kAccumulatorError =
        EncodingError::NUMBER_EXCEEDS_53_BITS;

    static Value fromSmall(uint32_t num) {
      return num;
    }

    static uint32_t toSmall(Value num) {
      return static_cast<uint32_t>(num);
    }

    static bool isNegative(Value) {
      return false;
    }

    static uint8_t low7(Value num) {
      return num & 0x7f;
    }

    static bool lessOrEqual(Value num, uint32_t small) {
      return num <= small;
    }

    static void shiftIn7(Value &num, uint8_t digit) {
      num = (num << 7) + digit;
    }

    static void shiftOut7(Value &num) {
      num >>= 7;
    }

    static void add(Value &num, uint32_t small) {
      num += small;
    }

    static void sub(Value &num, uint32_t small) {
      num -= small;
    }

    static bool canShiftIn(Value num, uint8_t digit) {
      return num <= (kMaxSafeInteger - digit) / 128;
    }

    static bool canAdd(Value num, uint32_t small) {
      return num <= kMaxSafeInteger - small;
    }

    static outcome::result<Value> readFixed64(BytesIn data, size_t off) {
      return readU64(data, off);
    }

    static outcome::result<size_t> writeFixed64(BytesOut dst,
                                                Value num,
                                                size_t off) {
      return writeU64(dst, num, off);
    }
  };

  /**
   * Arbitrary-precision integer.
   * Fixed 8-byte fields cover the full 64-bit range, the accumulator stops at
   * 64 bits.
   */
  template <>
  struct NumericRepr<BigInt> {
    using Value = BigInt;

    static constexpr EncodingError kAccumulatorError =
        EncodingError::NUMBER_EXCEEDS_64_BITS;

    static Value fromSmall(uint32_t num) {
      return Value{num};
    }

    static uint32_t toSmall(const Value &num) {
      return num.convert_to<uint32_t>();
    }

    static bool isNegative(const Value &num) {
      return num.sign() < 0;
    }

    static uint8_t low7(const Value &num) {
      return static_cast<uint8_t>(
          static_cast<Value>(num & 0x7f).convert_to<uint32_t>());
    }

    static bool lessOrEqual(const Value &num, uint32_t small) {
      return num <= small;
    }

    static void shiftIn7(Value &num, uint8_t digit) {
      num <<= 7;
      num += digit;
    }

    static void shiftOut7(Value &num) {
      num >>= 7;
    }

    static void add(Value &num, uint32_t small) {
      num += small;
    }

    static void sub(Value &num, uint32_t small) {
      num -= small;
    }

    /// Only the prefix is bounded, so 64-bit encodings of 2^64-1 still fold
    static bool canShiftIn(const Value &num, uint8_t) {
      return bitLength(num) <= kMaxAccumulatorBits;
    }

    static bool canAdd(const Value &, uint32_t) {
      return true;
    }

    static outcome::result<Value> readFixed64(BytesIn data, size_t off) {
      return readU64BN(data, off);
    }

    static outcome::result<size_t> writeFixed64(BytesOut dst,
                                                const Value &num,
                                                size_t off) {
      return writeU64BN(dst, num, off);
    }
  };
}  // namespace numcodec
