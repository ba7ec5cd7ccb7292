/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/varint/continuation.hpp>

#include <numcodec/basic/numeric_repr.hpp>
#include <numcodec/log/logger.hpp>
#include <stdexcept>

namespace numcodec {
  namespace {
    const log::Logger &log() {
      static log::Logger logger = log::createLogger("Continuation");
      return logger;
    }

    template <typename T>
    outcome::result<Varint<T>> decode(BytesIn data, size_t off) {
      using Repr = NumericRepr<T>;
      T num = Repr::fromSmall(0);
      size_t size = 0;
      while (true) {
        BOOST_OUTCOME_TRY(checkBounds(data.size(), off, 1));
        const auto byte = data[off++];
        ++size;
        const uint8_t digit = byte & 0x7f;
        if (not Repr::canShiftIn(num, digit)) {
          SL_TRACE(log(), "varint overflow after {} bytes", size);
          return Repr::kAccumulatorError;
        }
        Repr::shiftIn7(num, digit);
        if ((byte & kContinuationFlag) == 0) {
          break;
        }
        if (not Repr::canAdd(num, 1)) {
          SL_TRACE(log(), "varint overflow after {} bytes", size);
          return Repr::kAccumulatorError;
        }
        Repr::add(num, 1);
      }
      return Varint<T>{size, std::move(num)};
    }

    /// Inverse of the decode step: floor(num / 128) - 1
    template <typename T>
    void stepDown(T &num) {
      using Repr = NumericRepr<T>;
      Repr::shiftOut7(num);
      Repr::sub(num, 1);
    }

    template <typename T>
    size_t sizeOf(T num) {
      using Repr = NumericRepr<T>;
      size_t size = 1;
      while (not Repr::lessOrEqual(num, 0x7f)) {
        stepDown(num);
        ++size;
      }
      return size;
    }

    template <typename T>
    outcome::result<size_t> encode(BytesOut dst, T num, size_t off) {
      using Repr = NumericRepr<T>;
      const auto size = sizeOf(num);
      BOOST_OUTCOME_TRY(checkBounds(dst.size(), off, size));
      // Digits come out least significant first and are stored backwards
      auto pos = off + size;
      uint8_t flag = 0;
      while (true) {
        dst[--pos] = static_cast<uint8_t>(Repr::low7(num) | flag);
        if (Repr::lessOrEqual(num, 0x7f)) {
          break;
        }
        stepDown(num);
        flag = kContinuationFlag;
      }
      if (pos != off) {
        throw std::logic_error{"numcodec: continuation varint size mismatch"};
      }
      return off + size;
    }
  }  // namespace

  outcome::result<Varint<uint64_t>> readVarint2(BytesIn data, size_t off) {
    return decode<uint64_t>(data, off);
  }

  outcome::result<size_t> writeVarint2(BytesOut dst,
                                       uint64_t num,
                                       size_t off) {
    if (num > kMaxSafeInteger) {
      SL_TRACE(log(), "can not write {} as a safe integer", num);
      return EncodingError::NUMBER_EXCEEDS_53_BITS;
    }
    return encode(dst, num, off);
  }

  outcome::result<size_t> skipVarint2(BytesIn data, size_t off) {
    size_t size = 0;
    while (true) {
      BOOST_OUTCOME_TRY(checkBounds(data.size(), off, 1));
      const auto byte = data[off++];
      ++size;
      if ((byte & kContinuationFlag) == 0) {
        return size;
      }
    }
  }

  size_t sizeVarint2(uint64_t num) {
    return sizeOf(num);
  }

  outcome::result<Varint<BigInt>> readVarint2BN(BytesIn data, size_t off) {
    return decode<BigInt>(data, off);
  }

  outcome::result<size_t> writeVarint2BN(BytesOut dst,
                                         const BigInt &num,
                                         size_t off) {
    if (NumericRepr<BigInt>::isNegative(num)) {
      return EncodingError::NEGATIVE_NUMBER;
    }
    if (bitLength(num) <= kSafeBits) {
      return writeVarint2(dst, num.convert_to<uint64_t>(), off);
    }
    return encode(dst, num, off);
  }

  outcome::result<size_t> sizeVarint2BN(const BigInt &num) {
    if (NumericRepr<BigInt>::isNegative(num)) {
      return EncodingError::NEGATIVE_NUMBER;
    }
    if (bitLength(num) <= kSafeBits) {
      return sizeVarint2(num.convert_to<uint64_t>());
    }
    return sizeOf(num);
  }
}  // namespace numcodec
