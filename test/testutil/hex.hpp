/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/algorithm/hex.hpp>
#include <iterator>
#include <numcodec/common/types.hpp>
#include <string>
#include <string_view>

namespace testutil {
  inline numcodec::Bytes unhex(std::string_view hex) {
    numcodec::Bytes out;
    boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(out));
    return out;
  }

  inline std::string hex(numcodec::BytesIn bytes) {
    std::string out;
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(out));
    return out;
  }
}  // namespace testutil
