/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/money.hpp"

#include <limits>
#include <sstream>

#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"

using namespace moneta::model;

class MoneyFormatTest : public ::testing::Test {
 public:
  Money money(double amount, const std::string &code) {
    return Money::fromDouble(amount, Currency::of(code).assumeValue())
        .assumeValue();
  }
};

/**
 * @given a thousand in each built-in currency
 * @when it is beautified
 * @then the code and the amount in the currency locale are shown
 */
TEST_F(MoneyFormatTest, BeautifyUsesCurrencyLocale) {
  EXPECT_EQ(money(1000, "EUR").beautify(), "EUR 1.000,00");
  EXPECT_EQ(money(1000, "USD").beautify(), "USD 1,000.00");
  EXPECT_EQ(money(1000, "GBP").beautify(), "GBP 1,000.00");
}

TEST_F(MoneyFormatTest, BeautifyResults) {
  EXPECT_EQ(money(351.31, "EUR").beautify(), "EUR 351,31");
  EXPECT_EQ(money(7707.68, "USD").beautify(), "USD 7,707.68");
  EXPECT_EQ(money(12.5, "GBP").beautify(), "GBP 12.50");
}

TEST_F(MoneyFormatTest, BeautifyNegativeAndZero) {
  EXPECT_EQ(money(-1550.5, "EUR").beautify(), "EUR -1.550,50");
  EXPECT_EQ(money(-0.25, "USD").beautify(), "USD -0.25");
  EXPECT_EQ(money(0, "EUR").beautify(), "EUR 0,00");
  EXPECT_EQ(money(-0.001, "USD").beautify(), "USD 0.00");
}

TEST_F(MoneyFormatTest, StreamAndToString) {
  auto amount = money(19.9, "USD");
  std::stringstream ss;
  ss << amount;
  EXPECT_EQ(ss.str(), "USD 19.90");
  EXPECT_EQ(amount.toString(), "Money: [amount=19.90, currency=USD]");
}

/**
 * @given doubles that are not numbers
 * @when Money is created from them
 * @then kInvalidArgument is returned
 */
TEST_F(MoneyFormatTest, FromDoubleRejectsNonFinite) {
  auto eur = Currency::of("EUR").assumeValue();
  for (auto value : {std::numeric_limits<double>::quiet_NaN(),
                     std::numeric_limits<double>::infinity()}) {
    auto result = Money::fromDouble(value, eur);
    MONETA_ASSERT_RESULT_ERROR(result);
    EXPECT_EQ(result.assumeError().kind, MoneyError::Kind::kInvalidArgument);
  }
}
