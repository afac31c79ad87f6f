/***
 * Name: fastnum::tests::ParseUtil
 * Purpose: Validate the building blocks behind ParseInt and ParseDouble.
 * Inputs: none
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <string_view>

#include "fastnum/exceptions/format_error.h"
#include "fastnum/exceptions/range_error.h"
#include "fastnum/support/parse_util.h"

using namespace fastnum;
using namespace fastnum::support;

TEST(ParseUtil, ConsumeSignMinusOnly) {
  std::string_view text = "-12";
  bool is_negative = false;
  EXPECT_TRUE(ConsumeSign(text, is_negative, false));
  EXPECT_TRUE(is_negative);
  EXPECT_EQ("12", text);

  text = "+12";
  EXPECT_FALSE(ConsumeSign(text, is_negative, false));
  EXPECT_FALSE(is_negative);
  EXPECT_EQ("+12", text);
}

TEST(ParseUtil, ConsumeSignAllowPlus) {
  std::string_view text = "+7";
  bool is_negative = true;
  EXPECT_TRUE(ConsumeSign(text, is_negative, true));
  EXPECT_FALSE(is_negative);
  EXPECT_EQ("7", text);

  std::string_view empty;
  EXPECT_FALSE(ConsumeSign(empty, is_negative, true));
}

TEST(ParseUtil, ParseDigitsStrict) {
  EXPECT_EQ(0U, ParseDigitsStrict("0", "0"));
  EXPECT_EQ(4294967295U, ParseDigitsStrict("4294967295", "4294967295"));
  EXPECT_EQ(0U, ParseDigitsStrict("4294967296", "4294967296"));
  EXPECT_THROW(ParseDigitsStrict("", "-"), exceptions::FormatError);
  EXPECT_THROW(ParseDigitsStrict("1-2", "1-2"), exceptions::FormatError);
}

TEST(ParseUtil, IndexOfExponentMarker) {
  EXPECT_EQ(3U, IndexOfExponentMarker("1.5e3"));
  EXPECT_EQ(1U, IndexOfExponentMarker("2E-3"));
  EXPECT_EQ(0U, IndexOfExponentMarker("e5"));
  EXPECT_EQ(1U, IndexOfExponentMarker("1eE"));
  EXPECT_EQ(4U, IndexOfExponentMarker("12.5"));
  EXPECT_EQ(0U, IndexOfExponentMarker(""));
}

TEST(ParseUtil, ParseMantissaOnly) {
  EXPECT_EQ(12.0, ParseMantissaOnly("12"));
  EXPECT_EQ(-12.5, ParseMantissaOnly("-12.5"));
  EXPECT_EQ(0.5, ParseMantissaOnly(".5"));
  EXPECT_EQ(3.0, ParseMantissaOnly("3."));
  EXPECT_THROW(ParseMantissaOnly(""), exceptions::FormatError);
  EXPECT_THROW(ParseMantissaOnly("1e5"), exceptions::FormatError);
  EXPECT_THROW(ParseMantissaOnly("1..2"), exceptions::FormatError);
  EXPECT_THROW(ParseMantissaOnly("-."), exceptions::FormatError);
}

TEST(ParseUtil, ParseExponentAfterE) {
  EXPECT_EQ(3, ParseExponentAfterE("3"));
  EXPECT_EQ(3, ParseExponentAfterE("+3"));
  EXPECT_EQ(-12, ParseExponentAfterE("-12"));
  EXPECT_EQ(0, ParseExponentAfterE("-0"));
  EXPECT_THROW(ParseExponentAfterE(""), exceptions::FormatError);
  EXPECT_THROW(ParseExponentAfterE("+"), exceptions::FormatError);
  EXPECT_EQ(-3, ParseExponentAfterE("+-3"));
  EXPECT_EQ(3, ParseExponentAfterE("--3"));
  EXPECT_THROW(ParseExponentAfterE("-+3"), exceptions::FormatError);
  EXPECT_THROW(ParseExponentAfterE("--"), exceptions::FormatError);
  EXPECT_THROW(ParseExponentAfterE("3a"), exceptions::FormatError);
}

TEST(ParseUtil, SliceRange) {
  EXPECT_EQ("123", SliceRange("abc123xyz", 3, 6));
  EXPECT_EQ("", SliceRange("abc", 3, 3));
  EXPECT_THROW(SliceRange("abc", 2, 1), exceptions::RangeError);
  EXPECT_THROW(SliceRange("abc", 0, 4), exceptions::RangeError);
}
