/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <numcodec/common/error.hpp>
#include <numcodec/common/types.hpp>

/**
 * Fixed-width 64-bit integers.
 *
 * Native readers and writers work on safe integers only: magnitudes above
 * 2^53-1 fail with `EncodingError::NUMBER_EXCEEDS_53_BITS`. The `BN` variants
 * cover the full 64-bit range.
 *
 * Every reader takes `(data, off)`, every writer takes `(dst, num, off)` and
 * returns the offset right after the written 8 bytes. All of them fail with
 * `EncodingError::OUT_OF_BOUNDS` when `[off, off + 8)` does not fit the buffer.
 */
namespace numcodec {
  constexpr size_t kFixed64Size = 8;

  /// uint64 little-endian
  outcome::result<uint64_t> readU64(BytesIn data, size_t off);

  /// uint64 big-endian
  outcome::result<uint64_t> readU64BE(BytesIn data, size_t off);

  /**
   * Truncating uint64 little-endian read.
   * The top 11 bits are dropped before the range check, so it never fails on
   * magnitude; values of 2^53 and above alias to their low 53 bits.
   */
  outcome::result<uint64_t> readU53(BytesIn data, size_t off);

  /// Truncating uint64 big-endian read, see `readU53`
  outcome::result<uint64_t> readU53BE(BytesIn data, size_t off);

  /// int64 little-endian, two's complement
  outcome::result<int64_t> read64(BytesIn data, size_t off);

  /// int64 big-endian, two's complement
  outcome::result<int64_t> read64BE(BytesIn data, size_t off);

  /**
   * Truncating int64 little-endian read.
   * The sign is kept, the top 11 bits of the magnitude's high word are
   * dropped.
   */
  outcome::result<int64_t> read53(BytesIn data, size_t off);

  /// Truncating int64 big-endian read, see `read53`
  outcome::result<int64_t> read53BE(BytesIn data, size_t off);

  outcome::result<size_t> writeU64(BytesOut dst, uint64_t num, size_t off);
  outcome::result<size_t> writeU64BE(BytesOut dst, uint64_t num, size_t off);

  /**
   * Signed native writes.
   * Accept -2^53 up to 2^53-1: negatives are stored from `|num| - 1`, which
   * must fit 53 bits. `read64` returns -2^53 for the bytes written here.
   */
  outcome::result<size_t> write64(BytesOut dst, int64_t num, size_t off);
  outcome::result<size_t> write64BE(BytesOut dst, int64_t num, size_t off);

  outcome::result<BigInt> readU64BN(BytesIn data, size_t off);
  outcome::result<BigInt> readU64BEBN(BytesIn data, size_t off);
  outcome::result<BigInt> read64BN(BytesIn data, size_t off);
  outcome::result<BigInt> read64BEBN(BytesIn data, size_t off);

  /**
   * Big-integer writers.
   * Magnitudes up to 53 bits take the native path. Wider numbers are masked
   * to 64 bits, negative ones are stored in 64-bit two's complement.
   */
  outcome::result<size_t> writeU64BN(BytesOut dst,
                                     const BigInt &num,
                                     size_t off);
  outcome::result<size_t> writeU64BEBN(BytesOut dst,
                                       const BigInt &num,
                                       size_t off);
  outcome::result<size_t> write64BN(BytesOut dst, const BigInt &num, size_t off);
  outcome::result<size_t> write64BEBN(BytesOut dst,
                                      const BigInt &num,
                                      size_t off);
}  // namespace numcodec
