/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <numcodec/common/text_encoding.hpp>
#include <numcodec/common/types.hpp>
#include <numcodec/varint/compact_size.hpp>

/**
 * Sizes of compact-size length-prefixed payloads.
 */
namespace numcodec {
  inline size_t sizeVarlen(size_t len) {
    return sizeVarint(len) + len;
  }

  inline size_t sizeVarBytes(BytesIn data) {
    return sizeVarlen(data.size());
  }

  inline size_t sizeVarString(std::string_view str,
                              TextEncoding encoding = TextEncoding::UTF8) {
    return sizeVarlen(byteLength(str, encoding));
  }
}  // namespace numcodec
