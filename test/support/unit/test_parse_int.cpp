/***
 * Name: fastnum::tests::ParseInt
 * Purpose: Validate base-10 integer parsing over whole views and sub-ranges.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Compare against std::from_chars for representable values, check
 *   32-bit wrap-around, and assert FormatError on malformed input.
 */
#include <gtest/gtest.h>

#include <charconv>
#include <climits>
#include <string>
#include <string_view>
#include <system_error>

#include "fastnum/exceptions/format_error.h"
#include "fastnum/exceptions/range_error.h"
#include "fastnum/support/number_parse.h"

using namespace fastnum;
using fastnum::support::ParseInt;

static int ReferenceParse(std::string_view text) {
  int value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  EXPECT_EQ(result.ec, std::errc{});
  return value;
}

TEST(ParseInt, SimpleValues) {
  EXPECT_EQ(0, ParseInt("0"));
  EXPECT_EQ(7, ParseInt("7"));
  EXPECT_EQ(123, ParseInt("123"));
  EXPECT_EQ(-42, ParseInt("-42"));
  EXPECT_EQ(0, ParseInt("-0"));
  EXPECT_EQ(12, ParseInt("00012"));
}

TEST(ParseInt, AgreesWithFromChars) {
  for (int n = -200000; n <= 200000; n += 37) {
    const std::string text = std::to_string(n);
    EXPECT_EQ(ReferenceParse(text), ParseInt(text)) << text;
  }
  for (const char* text : {"2147483647", "-2147483648", "1000000000", "-999999999"}) {
    EXPECT_EQ(ReferenceParse(text), ParseInt(text)) << text;
  }
}

TEST(ParseInt, ToStringRoundTrip) {
  for (int n : {INT_MIN, INT_MIN + 1, -65536, -1, 0, 1, 65535, INT_MAX - 1, INT_MAX}) {
    EXPECT_EQ(n, ParseInt(std::to_string(n)));
  }
}

TEST(ParseInt, OverflowWrapsSilently) {
  EXPECT_EQ(INT_MIN, ParseInt("2147483648"));
  EXPECT_EQ(1, ParseInt("4294967297"));
  EXPECT_EQ(-1, ParseInt("4294967295"));
  EXPECT_EQ(INT_MAX, ParseInt("-2147483649"));
}

TEST(ParseInt, SubRange) {
  EXPECT_EQ(123, ParseInt("abc123xyz", 3, 6));
  EXPECT_EQ(-5, ParseInt("x=-5;", 2, 4));
  EXPECT_EQ(9, ParseInt("9", 0, 1));
}

TEST(ParseInt, RejectsEmptyInput) {
  EXPECT_THROW(ParseInt(""), exceptions::FormatError);
  EXPECT_THROW(ParseInt("123", 1, 1), exceptions::FormatError);
}

TEST(ParseInt, RejectsNonDigits) {
  EXPECT_THROW(ParseInt("12a"), exceptions::FormatError);
  EXPECT_THROW(ParseInt("a12"), exceptions::FormatError);
  EXPECT_THROW(ParseInt("+5"), exceptions::FormatError);
  EXPECT_THROW(ParseInt("--5"), exceptions::FormatError);
  EXPECT_THROW(ParseInt(" 5"), exceptions::FormatError);
  EXPECT_THROW(ParseInt("5 "), exceptions::FormatError);
  EXPECT_THROW(ParseInt("1,000"), exceptions::FormatError);
  EXPECT_THROW(ParseInt("1.0"), exceptions::FormatError);
  EXPECT_THROW(ParseInt("-"), exceptions::FormatError);
}

TEST(ParseInt, ErrorNamesOffendingRange) {
  try {
    ParseInt("abc12xdef", 3, 6);
    FAIL() << "expected FormatError";
  } catch (const exceptions::FormatError& ex) {
    EXPECT_EQ("Non-numeric character", ex.Reason());
    EXPECT_EQ("12x", ex.Input());
    EXPECT_STREQ("Non-numeric character in input '12x'", ex.what());
  }
}

TEST(ParseInt, InvalidIndexPairIsRangeError) {
  EXPECT_THROW(ParseInt("123", 2, 1), exceptions::RangeError);
  EXPECT_THROW(ParseInt("123", 0, 4), exceptions::RangeError);
}
