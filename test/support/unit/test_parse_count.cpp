/***
 * Name: test_parse_count
 * Purpose: Strict decimal count parsing used by command-line options.
 */
#include <gtest/gtest.h>
#include "tether/support/parse.h"
#include "tether/support/parse_util.h"
#include <cstddef>
#include <string>
#include <string_view>

using namespace tether::support;

TEST(ParseCount, AcceptsDigitsWithSurroundingSpace) {
  std::size_t v = 0;
  EXPECT_TRUE(ParseCount("  42 ", 100, v));
  EXPECT_EQ(v, 42u);
}

TEST(ParseCount, RejectsWithReason) {
  std::size_t v = 9;
  std::string err;
  EXPECT_FALSE(ParseCount("", 100, v, &err));
  EXPECT_EQ(err, "invalid count");
  EXPECT_FALSE(ParseCount("-1", 100, v, &err));
  EXPECT_EQ(err, "invalid count");
  EXPECT_FALSE(ParseCount("4 2", 100, v, &err));
  EXPECT_EQ(err, "trailing characters after count");
  EXPECT_FALSE(ParseCount("101", 100, v, &err));
  EXPECT_EQ(err, "count out of range");
  EXPECT_EQ(v, 9u);
}

TEST(ParseCount, BoundIsInclusive) {
  std::size_t v = 0;
  EXPECT_TRUE(ParseCount("100", 100, v));
  EXPECT_EQ(v, 100u);
}

TEST(ParseUtil, TrimLeadingSpaces) {
  std::string_view text = " \t x";
  TrimLeadingSpaces(text);
  EXPECT_EQ(text, "x");
}
