/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/decimal_format.hpp"

#include <gtest/gtest.h>

using namespace moneta::model;

class DecimalFormatTest : public ::testing::Test {
 public:
  Decimal parse(const std::string &str) {
    return Decimal::fromString(str).assumeValue();
  }

  DecimalFormat german_format{Locale::germany(), 2, 2};
  DecimalFormat us_format{Locale::us(), 2, 2};
};

/**
 * @given amounts of various magnitude
 * @when they are formatted in German and US locales
 * @then digits are grouped by three with the locale separators
 */
TEST_F(DecimalFormatTest, GroupsIntegerDigits) {
  EXPECT_EQ(german_format.format(parse("1000")), "1.000,00");
  EXPECT_EQ(us_format.format(parse("1000")), "1,000.00");
  EXPECT_EQ(us_format.format(parse("999.5")), "999.50");
  EXPECT_EQ(us_format.format(parse("1234567.891")), "1,234,567.89");
  EXPECT_EQ(german_format.format(parse("100000")), "100.000,00");
}

/**
 * @given values with more fraction digits than allowed
 * @when they are formatted
 * @then they are rounded half even
 */
TEST_F(DecimalFormatTest, RoundsHalfEven) {
  EXPECT_EQ(us_format.format(parse("0.125")), "0.12");
  EXPECT_EQ(us_format.format(parse("0.135")), "0.14");
  EXPECT_EQ(us_format.format(parse("0.1251")), "0.13");
}

/**
 * @given negative values, including one rounding to zero
 * @when they are formatted
 * @then the minus sign is shown only for non-zero results
 */
TEST_F(DecimalFormatTest, NegativeValues) {
  EXPECT_EQ(german_format.format(parse("-4575.69")), "-4.575,69");
  EXPECT_EQ(us_format.format(parse("-0.001")), "0.00");
  EXPECT_EQ(us_format.format(Decimal()), "0.00");
}

/**
 * @given a format with a range of fraction digits
 * @when values of different scale are formatted
 * @then the scale is kept within the range
 */
TEST_F(DecimalFormatTest, FractionDigitsRange) {
  DecimalFormat format(Locale::uk(), 1, 3);
  EXPECT_EQ(format.format(parse("5")), "5.0");
  EXPECT_EQ(format.format(parse("5.25")), "5.25");
  EXPECT_EQ(format.format(parse("5.12345")), "5.123");
  EXPECT_EQ(format.minFractionDigits(), 1u);
  EXPECT_EQ(format.maxFractionDigits(), 3u);
}
