#include "tandem/http-version.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace tandem::http {

TEST(HttpVersionTest, ParseValid) {
  Version version{};
  ASSERT_TRUE(ParseVersion("HTTP/1.0", version));
  EXPECT_EQ(version, HTTP_1_0);
  ASSERT_TRUE(ParseVersion("HTTP/1.1", version));
  EXPECT_EQ(version, HTTP_1_1);
  ASSERT_TRUE(ParseVersion("HTTP/2.0", version));
  EXPECT_EQ(version.major, 2);
  EXPECT_FALSE(version.isSupported());
}

TEST(HttpVersionTest, ParseInvalid) {
  Version version{};
  EXPECT_FALSE(ParseVersion("HTTP/1", version));
  EXPECT_FALSE(ParseVersion("HTTP/1.10", version));
  EXPECT_FALSE(ParseVersion("http/1.1", version));
  EXPECT_FALSE(ParseVersion("HTTP/1-1", version));
  EXPECT_FALSE(ParseVersion("HTTP/a.1", version));
}

TEST(HttpVersionTest, Ordering) {
  EXPECT_LT(HTTP_1_0, HTTP_1_1);
  EXPECT_TRUE(HTTP_1_1.defaultsToKeepAlive());
  EXPECT_FALSE(HTTP_1_0.defaultsToKeepAlive());
}

TEST(HttpVersionTest, Write) {
  char buf[kVersionStrLen];
  char *end = WriteVersion(HTTP_1_0, buf);
  EXPECT_EQ(std::string_view(buf, end), "HTTP/1.0");
}

}  // namespace tandem::http
