/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/varint/compact_size.hpp>

#include <boost/endian/conversion.hpp>
#include <numcodec/basic/numeric_repr.hpp>
#include <numcodec/log/logger.hpp>

namespace numcodec {
  namespace {
    const log::Logger &log() {
      static log::Logger logger = log::createLogger("CompactSize");
      return logger;
    }

    size_t sizeOfSmall(uint32_t num) {
      if (num < kCompactSize16) {
        return 1;
      }
      if (num <= 0xffff) {
        return 3;
      }
      return 5;
    }

    size_t sizeOfTag(uint8_t tag) {
      switch (tag) {
        case kCompactSize64:
          return 9;
        case kCompactSize32:
          return 5;
        case kCompactSize16:
          return 3;
        default:
          return 1;
      }
    }

    outcome::result<void> checkCanonical(bool canonical, uint8_t tag) {
      if (not canonical) {
        SL_DEBUG(log(), "non-canonical varint with tag {:#x}", tag);
        return EncodingError::NON_CANONICAL_VARINT;
      }
      return outcome::success();
    }

    template <typename T>
    outcome::result<Varint<T>> decode(BytesIn data, size_t off) {
      using Repr = NumericRepr<T>;
      BOOST_OUTCOME_TRY(checkBounds(data.size(), off, 1));
      const auto tag = data[off];
      const auto size = sizeOfTag(tag);
      BOOST_OUTCOME_TRY(checkBounds(data.size(), off, size));
      const auto *payload = data.data() + off + 1;
      switch (tag) {
        case kCompactSize64: {
          BOOST_OUTCOME_TRY(auto value, Repr::readFixed64(data, off + 1));
          BOOST_OUTCOME_TRY(checkCanonical(bitLength(value) > 32, tag));
          return Varint<T>{size, std::move(value)};
        }
        case kCompactSize32: {
          auto value = boost::endian::load_little_u32(payload);
          BOOST_OUTCOME_TRY(checkCanonical(value > 0xffff, tag));
          return Varint<T>{size, Repr::fromSmall(value)};
        }
        case kCompactSize16: {
          auto value = boost::endian::load_little_u16(payload);
          BOOST_OUTCOME_TRY(checkCanonical(value >= kCompactSize16, tag));
          return Varint<T>{size, Repr::fromSmall(value)};
        }
        default:
          return Varint<T>{size, Repr::fromSmall(tag)};
      }
    }

    template <typename T>
    size_t sizeOf(const T &num) {
      if (bitLength(num) > 32) {
        return 9;
      }
      return sizeOfSmall(NumericRepr<T>::toSmall(num));
    }

    template <typename T>
    outcome::result<size_t> encode(BytesOut dst, const T &num, size_t off) {
      using Repr = NumericRepr<T>;
      if (Repr::isNegative(num)) {
        return EncodingError::NEGATIVE_NUMBER;
      }
      if (bitLength(num) > 64) {
        return EncodingError::NUMBER_EXCEEDS_64_BITS;
      }
      BOOST_OUTCOME_TRY(checkBounds(dst.size(), off, sizeOf(num)));
      if (bitLength(num) > 32) {
        // 8-byte payload checks its own range before writing
        BOOST_OUTCOME_TRY(auto end, Repr::writeFixed64(dst, num, off + 1));
        dst[off] = kCompactSize64;
        return end;
      }
      const auto small = Repr::toSmall(num);
      auto *out = dst.data() + off;
      if (small < kCompactSize16) {
        out[0] = static_cast<uint8_t>(small);
        return off + 1;
      }
      if (small <= 0xffff) {
        out[0] = kCompactSize16;
        boost::endian::store_little_u16(out + 1,
                                        static_cast<uint16_t>(small));
        return off + 3;
      }
      out[0] = kCompactSize32;
      boost::endian::store_little_u32(out + 1, small);
      return off + 5;
    }
  }  // namespace

  outcome::result<Varint<uint64_t>> readVarint(BytesIn data, size_t off) {
    return decode<uint64_t>(data, off);
  }

  outcome::result<size_t> writeVarint(BytesOut dst, uint64_t num, size_t off) {
    return encode(dst, num, off);
  }

  outcome::result<size_t> skipVarint(BytesIn data, size_t off) {
    BOOST_OUTCOME_TRY(checkBounds(data.size(), off, 1));
    const auto size = sizeOfTag(data[off]);
    BOOST_OUTCOME_TRY(checkBounds(data.size(), off, size));
    return size;
  }

  size_t sizeVarint(uint64_t num) {
    return sizeOf(num);
  }

  outcome::result<Varint<BigInt>> readVarintBN(BytesIn data, size_t off) {
    return decode<BigInt>(data, off);
  }

  outcome::result<size_t> writeVarintBN(BytesOut dst,
                                        const BigInt &num,
                                        size_t off) {
    return encode(dst, num, off);
  }

  outcome::result<size_t> sizeVarintBN(const BigInt &num) {
    if (NumericRepr<BigInt>::isNegative(num)) {
      return EncodingError::NEGATIVE_NUMBER;
    }
    return sizeOf(num);
  }
}  // namespace numcodec
