#include "tandem/char-hexadecimal-converter.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string_view>

namespace tandem {

namespace {
std::string_view ToHex(uint64_t value, char *buf) { return {buf, to_lower_hex(value, buf)}; }
}  // namespace

TEST(CharHexadecimalConverterTest, FromHexDigit) {
  EXPECT_EQ(from_hex_digit('0'), 0);
  EXPECT_EQ(from_hex_digit('9'), 9);
  EXPECT_EQ(from_hex_digit('a'), 10);
  EXPECT_EQ(from_hex_digit('F'), 15);
  EXPECT_EQ(from_hex_digit('g'), -1);
  EXPECT_EQ(from_hex_digit(' '), -1);
}

TEST(CharHexadecimalConverterTest, NbHexDigits) {
  EXPECT_EQ(nhexdigits(0), 1);
  EXPECT_EQ(nhexdigits(15), 1);
  EXPECT_EQ(nhexdigits(16), 2);
  EXPECT_EQ(nhexdigits(0x1000), 4);
  EXPECT_EQ(nhexdigits(std::numeric_limits<uint64_t>::max()), 16);
}

TEST(CharHexadecimalConverterTest, ToLowerHex) {
  char buf[16];
  EXPECT_EQ(ToHex(0, buf), "0");
  EXPECT_EQ(ToHex(5, buf), "5");
  EXPECT_EQ(ToHex(26, buf), "1a");
  EXPECT_EQ(ToHex(4096, buf), "1000");
  EXPECT_EQ(ToHex(std::numeric_limits<uint64_t>::max(), buf), "ffffffffffffffff");
}

}  // namespace tandem
