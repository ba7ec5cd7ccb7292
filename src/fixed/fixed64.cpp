/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/fixed/fixed64.hpp>

#include <boost/endian/conversion.hpp>
#include <numcodec/basic/numeric_repr.hpp>
#include <numcodec/common/constants.hpp>
#include <numcodec/log/logger.hpp>

namespace numcodec {
  namespace {
    const log::Logger &log() {
      static log::Logger logger = log::createLogger("Fixed64");
      return logger;
    }

    /// What a native reader does with the top 11 bits of the high word
    enum class HighBits {
      STRICT,
      TRUNCATE_53,
    };

    struct Words {
      uint32_t hi;
      uint32_t lo;
    };

    Words loadWords(BytesIn data, size_t off, ByteOrder order) {
      const auto *p = data.data() + off;
      if (order == ByteOrder::BIG) {
        return {boost::endian::load_big_u32(p),
                boost::endian::load_big_u32(p + 4)};
      }
      return {boost::endian::load_little_u32(p + 4),
              boost::endian::load_little_u32(p)};
    }

    void storeWords(BytesOut dst, size_t off, Words words, ByteOrder order) {
      auto *p = dst.data() + off;
      if (order == ByteOrder::BIG) {
        boost::endian::store_big_u32(p, words.hi);
        boost::endian::store_big_u32(p + 4, words.lo);
      } else {
        boost::endian::store_little_u32(p, words.lo);
        boost::endian::store_little_u32(p + 4, words.hi);
      }
    }

    uint64_t join(Words words) {
      return (uint64_t{words.hi} << 32) | words.lo;
    }

    outcome::result<void> checkSafeHigh(uint32_t hi) {
      if ((hi & kUnsafeHighMask) != 0) {
        SL_TRACE(log(), "high word {:#x} exceeds 2^53-1", hi);
        return EncodingError::NUMBER_EXCEEDS_53_BITS;
      }
      return outcome::success();
    }

    outcome::result<uint64_t> readUnsigned(BytesIn data,
                                           size_t off,
                                           HighBits high_bits,
                                           ByteOrder order) {
      BOOST_OUTCOME_TRY(checkBounds(data.size(), off, kFixed64Size));
      auto words = loadWords(data, off, order);
      if (high_bits == HighBits::TRUNCATE_53) {
        words.hi &= kSafeHighMask;
      }
      BOOST_OUTCOME_TRY(checkSafeHigh(words.hi));
      return join(words);
    }

    outcome::result<int64_t> readSigned(BytesIn data,
                                        size_t off,
                                        HighBits high_bits,
                                        ByteOrder order) {
      BOOST_OUTCOME_TRY(checkBounds(data.size(), off, kFixed64Size));
      auto words = loadWords(data, off, order);
      const bool negative = (words.hi & 0x80000000) != 0;
      if (negative) {
        words.hi = ~words.hi;
        words.lo = ~words.lo;
      }
      if (high_bits == HighBits::TRUNCATE_53) {
        words.hi &= kSafeHighMask;
      }
      BOOST_OUTCOME_TRY(checkSafeHigh(words.hi));
      auto magnitude = static_cast<int64_t>(join(words));
      if (negative) {
        return -(magnitude + 1);
      }
      return magnitude;
    }

    /**
     * Store a safe integer given as sign and `|num| - 1` for negatives
     * (`|num|` otherwise).
     */
    outcome::result<size_t> writeSafe(BytesOut dst,
                                      bool negative,
                                      uint64_t magnitude,
                                      size_t off,
                                      ByteOrder order) {
      if (magnitude > kMaxSafeInteger) {
        SL_TRACE(log(), "can not write {} as a safe integer", magnitude);
        return EncodingError::NUMBER_EXCEEDS_53_BITS;
      }
      BOOST_OUTCOME_TRY(checkBounds(dst.size(), off, kFixed64Size));
      Words words{static_cast<uint32_t>(magnitude >> 32),
                  static_cast<uint32_t>(magnitude)};
      if (negative) {
        words.hi = ~words.hi;
        words.lo = ~words.lo;
      }
      storeWords(dst, off, words, order);
      return off + kFixed64Size;
    }

    outcome::result<size_t> writeSigned(BytesOut dst,
                                        int64_t num,
                                        size_t off,
                                        ByteOrder order) {
      if (num < 0) {
        // -num - 1 without overflowing on INT64_MIN
        return writeSafe(dst, true, ~static_cast<uint64_t>(num), off, order);
      }
      return writeSafe(dst, false, static_cast<uint64_t>(num), off, order);
    }

    outcome::result<uint64_t> loadWord(BytesIn data,
                                       size_t off,
                                       ByteOrder order) {
      BOOST_OUTCOME_TRY(checkBounds(data.size(), off, kFixed64Size));
      const auto *p = data.data() + off;
      if (order == ByteOrder::BIG) {
        return boost::endian::load_big_u64(p);
      }
      return boost::endian::load_little_u64(p);
    }

    outcome::result<BigInt> readUnsignedBN(BytesIn data,
                                           size_t off,
                                           ByteOrder order) {
      BOOST_OUTCOME_TRY(auto word, loadWord(data, off, order));
      return BigInt{word};
    }

    outcome::result<BigInt> readSignedBN(BytesIn data,
                                         size_t off,
                                         ByteOrder order) {
      BOOST_OUTCOME_TRY(auto word, loadWord(data, off, order));
      return BigInt{static_cast<int64_t>(word)};
    }

    outcome::result<size_t> writeBN(BytesOut dst,
                                    const BigInt &num,
                                    size_t off,
                                    ByteOrder order) {
      if (bitLength(num) <= kSafeBits) {
        return writeSigned(dst, num.convert_to<int64_t>(), off, order);
      }
      BOOST_OUTCOME_TRY(checkBounds(dst.size(), off, kFixed64Size));
      const BigInt magnitude = boost::multiprecision::abs(num) & kU64Max;
      auto word = magnitude.convert_to<uint64_t>();
      if (num.sign() < 0) {
        word = ~word + 1;
      }
      auto *p = dst.data() + off;
      if (order == ByteOrder::BIG) {
        boost::endian::store_big_u64(p, word);
      } else {
        boost::endian::store_little_u64(p, word);
      }
      return off + kFixed64Size;
    }
  }  // namespace

  outcome::result<uint64_t> readU64(BytesIn data, size_t off) {
    return readUnsigned(data, off, HighBits::STRICT, ByteOrder::LITTLE);
  }

  outcome::result<uint64_t> readU64BE(BytesIn data, size_t off) {
    return readUnsigned(data, off, HighBits::STRICT, ByteOrder::BIG);
  }

  outcome::result<uint64_t> readU53(BytesIn data, size_t off) {
    return readUnsigned(data, off, HighBits::TRUNCATE_53, ByteOrder::LITTLE);
  }

  outcome::result<uint64_t> readU53BE(BytesIn data, size_t off) {
    return readUnsigned(data, off, HighBits::TRUNCATE_53, ByteOrder::BIG);
  }

  outcome::result<int64_t> read64(BytesIn data, size_t off) {
    return readSigned(data, off, HighBits::STRICT, ByteOrder::LITTLE);
  }

  outcome::result<int64_t> read64BE(BytesIn data, size_t off) {
    return readSigned(data, off, HighBits::STRICT, ByteOrder::BIG);
  }

  outcome::result<int64_t> read53(BytesIn data, size_t off) {
    return readSigned(data, off, HighBits::TRUNCATE_53, ByteOrder::LITTLE);
  }

  outcome::result<int64_t> read53BE(BytesIn data, size_t off) {
    return readSigned(data, off, HighBits::TRUNCATE_53, ByteOrder::BIG);
  }

  outcome::result<size_t> writeU64(BytesOut dst, uint64_t num, size_t off) {
    return writeSafe(dst, false, num, off, ByteOrder::LITTLE);
  }

  outcome::result<size_t> writeU64BE(BytesOut dst, uint64_t num, size_t off) {
    return writeSafe(dst, false, num, off, ByteOrder::BIG);
  }

  outcome::result<size_t> write64(BytesOut dst, int64_t num, size_t off) {
    return writeSigned(dst, num, off, ByteOrder::LITTLE);
  }

  outcome::result<size_t> write64BE(BytesOut dst, int64_t num, size_t off) {
    return writeSigned(dst, num, off, ByteOrder::BIG);
  }

  outcome::result<BigInt> readU64BN(BytesIn data, size_t off) {
    return readUnsignedBN(data, off, ByteOrder::LITTLE);
  }

  outcome::result<BigInt> readU64BEBN(BytesIn data, size_t off) {
    return readUnsignedBN(data, off, ByteOrder::BIG);
  }

  outcome::result<BigInt> read64BN(BytesIn data, size_t off) {
    return readSignedBN(data, off, ByteOrder::LITTLE);
  }

  outcome::result<BigInt> read64BEBN(BytesIn data, size_t off) {
    return readSignedBN(data, off, ByteOrder::BIG);
  }

  outcome::result<size_t> writeU64BN(BytesOut dst,
                                     const BigInt &num,
                                     size_t off) {
    return writeBN(dst, num, off, ByteOrder::LITTLE);
  }

  outcome::result<size_t> writeU64BEBN(BytesOut dst,
                                       const BigInt &num,
                                       size_t off) {
    return writeBN(dst, num, off, ByteOrder::BIG);
  }

  outcome::result<size_t> write64BN(BytesOut dst,
                                    const BigInt &num,
                                    size_t off) {
    return writeBN(dst, num, off, ByteOrder::LITTLE);
  }

  outcome::result<size_t> write64BEBN(BytesOut dst,
                                      const BigInt &num,
                                      size_t off) {
    return writeBN(dst, num, off, ByteOrder::BIG);
  }
}  // namespace numcodec
