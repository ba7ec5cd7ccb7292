/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <numcodec/common/error.hpp>
#include <numcodec/common/types.hpp>

/**
 * Compact-size varint.
 *
 * | value             | bytes                         |
 * |-------------------|-------------------------------|
 * | < 0xfd            | the value                     |
 * | <= 0xffff         | 0xfd, uint16 little-endian    |
 * | <= 0xffffffff     | 0xfe, uint32 little-endian    |
 * | <= 2^64-1         | 0xff, uint64 little-endian    |
 *
 * Only the minimal encoding of a value is accepted on decode.
 */
namespace numcodec {
  constexpr uint8_t kCompactSize16 = 0xfd;
  constexpr uint8_t kCompactSize32 = 0xfe;
  constexpr uint8_t kCompactSize64 = 0xff;

  /**
   * Decode a compact-size varint at `off`.
   * Fails with:
   * - `OUT_OF_BOUNDS` if `off` or the tagged payload is past the buffer end,
   * - `NON_CANONICAL_VARINT` if a shorter encoding of the value exists,
   * - `NUMBER_EXCEEDS_53_BITS` if the 9-byte form holds more than 2^53-1.
   */
  outcome::result<Varint<uint64_t>> readVarint(BytesIn data, size_t off);

  /**
   * Encode `num` at `off` with the minimal tag.
   * Values above 2^53-1 fail with `NUMBER_EXCEEDS_53_BITS`.
   * @return offset after the encoded bytes
   */
  outcome::result<size_t> writeVarint(BytesOut dst, uint64_t num, size_t off);

  /**
   * Number of bytes the varint at `off` occupies, judged by its first byte.
   */
  outcome::result<size_t> skipVarint(BytesIn data, size_t off);

  /// Encoded length of `num`: 1, 3, 5 or 9
  size_t sizeVarint(uint64_t num);

  /// Same as `readVarint`, the 9-byte form covers the full 64-bit range
  outcome::result<Varint<BigInt>> readVarintBN(BytesIn data, size_t off);

  /**
   * Fails with `NEGATIVE_NUMBER` for negative `num` and with
   * `NUMBER_EXCEEDS_64_BITS` above 2^64-1.
   */
  outcome::result<size_t> writeVarintBN(BytesOut dst,
                                        const BigInt &num,
                                        size_t off);

  /// Fails with `NEGATIVE_NUMBER` for negative `num`
  outcome::result<size_t> sizeVarintBN(const BigInt &num);
}  // namespace numcodec
