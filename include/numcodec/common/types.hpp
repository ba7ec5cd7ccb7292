/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace numcodec {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = std::span<const uint8_t>;
  using BytesOut = std::span<uint8_t>;

  /// Arbitrary-precision signed integer
  using BigInt = boost::multiprecision::cpp_int;

  enum class ByteOrder {
    LITTLE,
    BIG,
  };

  /**
   * Result of a varint decode.
   * @tparam T either a native `uint64_t` or `BigInt`
   */
  template <typename T>
  struct Varint {
    /// Number of bytes consumed
    size_t size;
    T value;
  };
}  // namespace numcodec
