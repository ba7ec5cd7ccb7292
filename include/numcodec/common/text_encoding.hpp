/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <string_view>

namespace numcodec {

  /**
   * Encoding a string is converted to before it is written as bytes.
   * Source strings are UTF-8.
   */
  enum class TextEncoding {
    UTF8,
    /// One byte per UTF-16 code unit, high bits dropped
    ASCII,
    /// One byte per UTF-16 code unit
    LATIN1,
    UTF16LE,
    /// Two characters per byte
    HEX,
    BASE64,
  };

  enum class TextEncodingError {
    UNKNOWN_ENCODING = 1,
  };

  Q_ENUM_ERROR_CODE(TextEncodingError) {
    using E = decltype(e);
    switch (e) {
      case E::UNKNOWN_ENCODING:
        return "Unknown text encoding";
    }
    abort();
  }

  /**
   * Parse an encoding name, case-insensitive.
   * Accepts utf8, utf-8, ascii, latin1, binary, ucs2, ucs-2, utf16le,
   * utf-16le, hex and base64.
   */
  outcome::result<TextEncoding> textEncodingFromName(std::string_view name);

  /// Number of bytes `text` takes once converted to `encoding`
  size_t byteLength(std::string_view text, TextEncoding encoding);
}  // namespace numcodec
