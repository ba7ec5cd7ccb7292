/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/endian/conversion.hpp>
#include <qtils/byte_arr.hpp>

namespace numcodec {
  /// Single byte
  inline qtils::ByteArr<1> U8(uint8_t num) {
    qtils::ByteArr<1> out;
    out[0] = num;
    return out;
  }

  /// uint32 little-endian
  inline qtils::ByteArr<4> U32(uint32_t num) {
    qtils::ByteArr<4> out;
    boost::endian::store_little_u32(out.data(), num);
    return out;
  }

  /// uint32 big-endian
  inline qtils::ByteArr<4> U32BE(uint32_t num) {
    qtils::ByteArr<4> out;
    boost::endian::store_big_u32(out.data(), num);
    return out;
  }
}  // namespace numcodec
