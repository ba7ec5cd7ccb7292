#pragma once

#include <algorithm>
#include <cctype>
#include <numcodec/common/types.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace numcodec::example {
  /// Non-negative decimal number, nullopt for anything else
  inline std::optional<BigInt> parseDecimal(std::string_view arg) {
    if (arg.empty()
        or not std::ranges::all_of(
            arg, [](unsigned char c) { return std::isdigit(c) != 0; })) {
      return std::nullopt;
    }
    // a leading zero would select octal
    const auto first = arg.find_first_not_of('0');
    const std::string digits{first == arg.npos ? "0" : arg.substr(first)};
    return BigInt{digits.c_str()};
  }
}  // namespace numcodec::example
