/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace numcodec {

  /**
   * Errors of the numeric codec.
   * All of them abort the call before any value is produced or any byte is
   * written.
   */
  enum class EncodingError {
    /// Access at or beyond the end of the buffer
    OUT_OF_BOUNDS = 1,
    /// Native path got a magnitude above 2^53-1
    NUMBER_EXCEEDS_53_BITS,
    /// Compact-size varint uses a longer tag than its value needs
    NON_CANONICAL_VARINT,
    /// Big-integer accumulation went past 64 bits
    NUMBER_EXCEEDS_64_BITS,
    /// Negative big integer given to an unsigned varint
    NEGATIVE_NUMBER,
  };

  /**
   * Human-readable strings for `EncodingError`.
   */
  Q_ENUM_ERROR_CODE(EncodingError) {
    using E = decltype(e);
    switch (e) {
      case E::OUT_OF_BOUNDS:
        return "Offset is out of buffer bounds";
      case E::NUMBER_EXCEEDS_53_BITS:
        return "Number exceeds 2^53-1";
      case E::NON_CANONICAL_VARINT:
        return "Non-canonical varint";
      case E::NUMBER_EXCEEDS_64_BITS:
        return "Number exceeds 64 bits";
      case E::NEGATIVE_NUMBER:
        return "Negative number can not be encoded as varint";
    }
    abort();
  }

  /**
   * Class of a codec fault.
   * BOUNDS - the buffer is too short for the requested access.
   * RANGE - the value is outside of what the called path may represent.
   */
  enum class FaultKind {
    BOUNDS,
    RANGE,
  };

  inline FaultKind faultKind(EncodingError e) {
    return e == EncodingError::OUT_OF_BOUNDS ? FaultKind::BOUNDS
                                             : FaultKind::RANGE;
  }

  /**
   * Fails with `OUT_OF_BOUNDS` unless `[off, off + size)` lies within a
   * buffer of `length` bytes.
   */
  inline outcome::result<void> checkBounds(size_t length,
                                           size_t off,
                                           size_t size) {
    if (off > length or size > length - off) {
      return EncodingError::OUT_OF_BOUNDS;
    }
    return outcome::success();
  }
}  // namespace numcodec
