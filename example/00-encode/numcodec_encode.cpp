#include <fmt/ranges.h>
#include <numcodec/fixed/fixed64.hpp>
#include <numcodec/log/simple.hpp>
#include <numcodec/varint/compact_size.hpp>
#include <numcodec/varint/continuation.hpp>
#include <string_view>

#include "parse_decimal.hpp"

int main(int argc, char **argv) {
  numcodec::simpleLoggingSystem();
  auto log = numcodec::log::createLogger("Encode");

  if (argc < 2) {
    log->info("Usage: {} <number>...", argv[0]);
    return EXIT_FAILURE;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    auto parsed = numcodec::example::parseDecimal(arg);
    if (not parsed) {
      log->error("'{}' is not a non-negative decimal number, skipped", arg);
      continue;
    }
    const auto &num = *parsed;

    auto compact_size = numcodec::sizeVarintBN(num);
    auto continuation_size = numcodec::sizeVarint2BN(num);
    if (not compact_size or not continuation_size) {
      log->error("{} can not be encoded: {}, skipped",
                 arg,
                 compact_size ? continuation_size.error().message()
                              : compact_size.error().message());
      continue;
    }

    numcodec::Bytes compact(compact_size.value());
    numcodec::Bytes continuation(continuation_size.value());
    numcodec::Bytes fixed(numcodec::kFixed64Size);
    auto written = numcodec::writeVarintBN(compact, num, 0);
    if (written) {
      written = numcodec::writeVarint2BN(continuation, num, 0);
    }
    if (written) {
      written = numcodec::writeU64BN(fixed, num, 0);
    }
    if (not written) {
      log->error("{} can not be encoded: {}, skipped",
                 arg,
                 written.error().message());
      continue;
    }

    log->info("{}: compact-size {:02x}, continuation {:02x}, u64 {:02x}",
              num.str(),
              fmt::join(compact, ""),
              fmt::join(continuation, ""),
              fmt::join(fixed, ""));
  }
  return EXIT_SUCCESS;
}
