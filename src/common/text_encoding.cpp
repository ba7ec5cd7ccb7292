/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/common/text_encoding.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace numcodec {
  namespace {
    constexpr std::pair<std::string_view, TextEncoding> kNames[]{
        {"utf8", TextEncoding::UTF8},
        {"utf-8", TextEncoding::UTF8},
        {"ascii", TextEncoding::ASCII},
        {"latin1", TextEncoding::LATIN1},
        {"binary", TextEncoding::LATIN1},
        {"ucs2", TextEncoding::UTF16LE},
        {"ucs-2", TextEncoding::UTF16LE},
        {"utf16le", TextEncoding::UTF16LE},
        {"utf-16le", TextEncoding::UTF16LE},
        {"hex", TextEncoding::HEX},
        {"base64", TextEncoding::BASE64},
    };

    /**
     * UTF-16 code units of UTF-8 `text`.
     * Lead bytes of 4-byte sequences stand for a surrogate pair, continuation
     * bytes count nothing.
     */
    size_t utf16Length(std::string_view text) {
      size_t units = 0;
      for (auto c : text) {
        auto byte = static_cast<uint8_t>(c);
        if ((byte & 0xc0) == 0x80) {
          continue;
        }
        units += byte >= 0xf0 ? 2 : 1;
      }
      return units;
    }

    size_t base64Length(std::string_view text) {
      auto n = text.size();
      for (int i = 0; i < 2 and n != 0 and text[n - 1] == '='; ++i) {
        --n;
      }
      return (n * 3) >> 2;
    }
  }  // namespace

  outcome::result<TextEncoding> textEncodingFromName(std::string_view name) {
    for (auto &[known, encoding] : kNames) {
      if (boost::algorithm::iequals(known, name)) {
        return encoding;
      }
    }
    return TextEncodingError::UNKNOWN_ENCODING;
  }

  size_t byteLength(std::string_view text, TextEncoding encoding) {
    switch (encoding) {
      case TextEncoding::UTF8:
        return text.size();
      case TextEncoding::ASCII:
      case TextEncoding::LATIN1:
        return utf16Length(text);
      case TextEncoding::UTF16LE:
        return utf16Length(text) * 2;
      case TextEncoding::HEX:
        return text.size() >> 1;
      case TextEncoding::BASE64:
        return base64Length(text);
    }
    throw std::logic_error{"numcodec: unhandled text encoding"};
  }
}  // namespace numcodec
