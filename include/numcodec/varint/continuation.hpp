/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <numcodec/common/error.hpp>
#include <numcodec/common/types.hpp>

/**
 * Continuation-bit varint.
 *
 * Base-128 digits, most significant first. Every byte but the last has the
 * 0x80 flag set. Each continuation adds one to the accumulated value before
 * the next digit is folded in:
 *   num = num * 128 + (byte & 0x7f); if (byte & 0x80) ++num;
 * so every length covers its own contiguous value range and each value has
 * exactly one encoding. This is not LEB128: 128 encodes as `80 00`, 16512 as
 * `80 80 00`.
 */
namespace numcodec {
  constexpr uint8_t kContinuationFlag = 0x80;

  /**
   * Decode a continuation varint at `off`.
   * Fails with `OUT_OF_BOUNDS` on empty or truncated input and with
   * `NUMBER_EXCEEDS_53_BITS` once the accumulated value leaves the safe range.
   */
  outcome::result<Varint<uint64_t>> readVarint2(BytesIn data, size_t off);

  /**
   * Encode `num` at `off`.
   * Values above 2^53-1 fail with `NUMBER_EXCEEDS_53_BITS`.
   * @return offset after the encoded bytes
   */
  outcome::result<size_t> writeVarint2(BytesOut dst, uint64_t num, size_t off);

  /// Number of bytes up to and including the first byte without the flag
  outcome::result<size_t> skipVarint2(BytesIn data, size_t off);

  size_t sizeVarint2(uint64_t num);

  /**
   * Big-integer decode.
   * Fails with `NUMBER_EXCEEDS_64_BITS` if the value accumulated so far is
   * wider than 64 bits when another digit follows.
   */
  outcome::result<Varint<BigInt>> readVarint2BN(BytesIn data, size_t off);

  /// Fails with `NEGATIVE_NUMBER` for negative `num`
  outcome::result<size_t> writeVarint2BN(BytesOut dst,
                                         const BigInt &num,
                                         size_t off);

  /// Fails with `NEGATIVE_NUMBER` for negative `num`
  outcome::result<size_t> sizeVarint2BN(const BigInt &num);
}  // namespace numcodec
