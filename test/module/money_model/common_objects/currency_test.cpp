/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/currency.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"

using namespace moneta::model;

/**
 * @given codes of the built-in currencies
 * @when they are looked up
 * @then currencies with two minor digits and their locales are returned
 */
TEST(CurrencyTest, BuiltinCurrencies) {
  for (const auto &code : Currency::builtinCodes()) {
    SCOPED_TRACE(code);
    auto result = Currency::of(code);
    MONETA_ASSERT_RESULT_VALUE(result);
    const auto &currency = *result.assumeValue();
    EXPECT_EQ(currency.code(), code);
    EXPECT_EQ(currency.symbol(), code);
    EXPECT_EQ(currency.minorDigits(), 2u);
    EXPECT_EQ(currency.factor(), 100u);
  }
  EXPECT_EQ(Currency::of("EUR").assumeValue()->locale(), Locale::germany());
  EXPECT_EQ(Currency::of("USD").assumeValue()->locale(), Locale::us());
  EXPECT_EQ(Currency::of("GBP").assumeValue()->locale(), Locale::uk());
}

/**
 * @given the same code looked up twice
 * @when the results are compared
 * @then the same shared instance is returned
 */
TEST(CurrencyTest, LookupReturnsSharedInstance) {
  EXPECT_EQ(Currency::of("USD").assumeValue(),
            Currency::of("USD").assumeValue());
}

/**
 * @given a code absent from the table
 * @when it is looked up
 * @then kUnknownCurrency carrying the code is returned
 */
TEST(CurrencyTest, UnknownCode) {
  auto result = Currency::of("ZZZ");
  MONETA_ASSERT_RESULT_ERROR(result);
  const auto &error = result.assumeError();
  EXPECT_EQ(error.kind, MoneyError::Kind::kUnknownCurrency);
  EXPECT_EQ(error.code, "ZZZ");
  EXPECT_EQ(error.description,
            "Currency with code ZZZ is unknown. Please check the list of "
            "available currencies.");
}

/**
 * @given a known code in lower case
 * @when it is looked up
 * @then the lookup fails, as the table is case sensitive
 */
TEST(CurrencyTest, LookupIsCaseSensitive) {
  MONETA_ASSERT_RESULT_ERROR(Currency::of("eur"));
  MONETA_ASSERT_RESULT_ERROR(Currency::of(""));
}

TEST(CurrencyTest, SameCurrency) {
  auto eur = Currency::of("EUR").assumeValue();
  auto usd = Currency::of("USD").assumeValue();
  EXPECT_TRUE(eur->isSameCurrency(*eur));
  EXPECT_FALSE(eur->isSameCurrency(*usd));
  EXPECT_EQ(*eur, *Currency::of("EUR").assumeValue());
  EXPECT_NE(*eur, *usd);
}

TEST(CurrencyTest, CurrencyFormat) {
  auto format = Currency::of("GBP").assumeValue()->currencyFormat();
  EXPECT_EQ(format.minFractionDigits(), 2u);
  EXPECT_EQ(format.maxFractionDigits(), 2u);
  EXPECT_EQ(format.locale(), Locale::uk());
}

/**
 * @given the built-in table
 * @when its codes are listed
 * @then every table entry is listed once in display order
 */
TEST(CurrencyTest, BuiltinCodesFollowTable) {
  EXPECT_THAT(Currency::builtinCodes(),
              ::testing::ElementsAre("EUR", "USD", "GBP"));
}
