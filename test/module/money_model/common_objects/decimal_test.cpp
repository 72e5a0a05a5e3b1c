/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/decimal.hpp"

#include <limits>

#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"

using namespace moneta::model;

namespace {
  Decimal parse(const std::string &str) {
    return Decimal::fromString(str).assumeValue();
  }
}  // namespace

/**
 * @given decimal strings in plain and scientific notation
 * @when they are parsed
 * @then unscaled value and scale are exact
 */
TEST(DecimalTest, ParsesPlainAndScientificNotation) {
  auto plain = parse("100.32");
  EXPECT_EQ(plain.unscaledValue(), 10032);
  EXPECT_EQ(plain.scale(), 2u);

  auto negative = parse("-0.05");
  EXPECT_EQ(negative.unscaledValue(), -5);
  EXPECT_EQ(negative.scale(), 2u);

  auto scientific = parse("1.5e3");
  EXPECT_EQ(scientific, Decimal(1500));
  EXPECT_EQ(scientific.scale(), 0u);

  auto small = parse("25E-4");
  EXPECT_EQ(small.unscaledValue(), 25);
  EXPECT_EQ(small.scale(), 4u);

  EXPECT_EQ(parse("007.10").toStringRepr(), "7.10");
}

/**
 * @given malformed strings
 * @when they are parsed
 * @then an error is returned
 */
TEST(DecimalTest, RejectsMalformedStrings) {
  for (const auto &str : {"", "-", "abc", "1.2.3", "12a", "1e", "1e+", "1e5000"}) {
    SCOPED_TRACE(str);
    MONETA_ASSERT_RESULT_ERROR(Decimal::fromString(str));
  }
}

/**
 * @given doubles which have no exact binary representation
 * @when they are converted to decimals
 * @then the shortest decimal reading back as the same double is produced
 */
TEST(DecimalTest, FromDoubleUsesShortestRepresentation) {
  EXPECT_EQ(Decimal::fromDouble(100.32).assumeValue().toStringRepr(),
            "100.32");
  EXPECT_EQ(Decimal::fromDouble(0.1).assumeValue(), parse("0.1"));
  EXPECT_EQ(Decimal::fromDouble(-4950).assumeValue(), Decimal(-4950));
  EXPECT_EQ(Decimal::fromDouble(1e-7).assumeValue(), parse("0.0000001"));
}

/**
 * @given NaN and infinities
 * @when they are converted to decimals
 * @then an error is returned
 */
TEST(DecimalTest, FromDoubleRejectsNonFinite) {
  MONETA_ASSERT_RESULT_ERROR(
      Decimal::fromDouble(std::numeric_limits<double>::quiet_NaN()));
  MONETA_ASSERT_RESULT_ERROR(
      Decimal::fromDouble(std::numeric_limits<double>::infinity()));
  MONETA_ASSERT_RESULT_ERROR(
      Decimal::fromDouble(-std::numeric_limits<double>::infinity()));
}

/**
 * @given decimals with a fraction
 * @when they are converted to integers
 * @then the fraction is truncated towards zero
 */
TEST(DecimalTest, ToBigIntegerTruncates) {
  EXPECT_EQ(parse("199.9").toBigInteger(), 199);
  EXPECT_EQ(parse("-199.9").toBigInteger(), -199);
  EXPECT_EQ(parse("1.999").multiply(100).toBigInteger(), 199);
}

/**
 * @given values on and around a rounding tie
 * @when the scale is reduced with half even rounding
 * @then ties go to the even neighbour and others to the nearest
 */
TEST(DecimalTest, SetScaleHalfEven) {
  const auto mode = Decimal::RoundingMode::kHalfEven;
  EXPECT_EQ(parse("2.345").setScale(2, mode), parse("2.34"));
  EXPECT_EQ(parse("2.355").setScale(2, mode), parse("2.36"));
  EXPECT_EQ(parse("2.3451").setScale(2, mode), parse("2.35"));
  EXPECT_EQ(parse("-2.355").setScale(2, mode), parse("-2.36"));
  EXPECT_EQ(parse("-0.004").setScale(2, mode).sign(), 0);
  EXPECT_EQ(parse("1.5").setScale(3, mode).unscaledValue(), 1500);
}

TEST(DecimalTest, SetScaleDown) {
  const auto mode = Decimal::RoundingMode::kDown;
  EXPECT_EQ(parse("2.359").setScale(2, mode), parse("2.35"));
  EXPECT_EQ(parse("-2.359").setScale(2, mode), parse("-2.35"));
}

/**
 * @given decimals equal by value but of different scale
 * @when they are compared
 * @then they are equal
 */
TEST(DecimalTest, ComparesByValue) {
  EXPECT_EQ(parse("1.50"), parse("1.5"));
  EXPECT_EQ(parse("1.50").compareTo(parse("1.5")), 0);
  EXPECT_LT(parse("-3"), parse("0.01"));
  EXPECT_GT(parse("10"), parse("9.999"));
  EXPECT_EQ(parse("10").compareTo(parse("9.999")), 1);
  EXPECT_EQ(parse("-10").compareTo(parse("9.999")), -1);
  EXPECT_NE(parse("0.1"), parse("0.01"));
}

TEST(DecimalTest, StringRepresentation) {
  EXPECT_EQ(Decimal(types::BigIntegerType(5), 3).toStringRepr(), "0.005");
  EXPECT_EQ(Decimal(types::BigIntegerType(-1250), 2).toStringRepr(), "-12.50");
  EXPECT_EQ(Decimal().toStringRepr(), "0");
  EXPECT_EQ(Decimal(42).toString(), "Decimal: [42]");
}
