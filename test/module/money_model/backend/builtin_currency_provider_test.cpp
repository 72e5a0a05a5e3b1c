/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "backend/builtin/builtin_currency_provider.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"
#include "module/libs/logger/mock_logger.hpp"

using namespace moneta::model;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class BuiltinCurrencyProviderTest : public ::testing::Test {
 public:
  void SetUp() override {
    log = std::make_shared<NiceMock<logger::MockLogger>>();
    ON_CALL(*log, shouldLog(_)).WillByDefault(Return(true));
    provider = std::make_unique<BuiltinCurrencyProvider>(log);
  }

  std::shared_ptr<NiceMock<logger::MockLogger>> log;
  std::unique_ptr<BuiltinCurrencyProvider> provider;
};

/**
 * @given provider over the built-in table
 * @when a known code is requested
 * @then the currency is returned and the resolution is logged at debug level
 */
TEST_F(BuiltinCurrencyProviderTest, ResolvesKnownCode) {
  EXPECT_CALL(*log, logInternal(logger::LogLevel::kDebug, HasSubstr("GBP")));

  auto result = provider->get("GBP");
  MONETA_ASSERT_RESULT_VALUE(result);
  EXPECT_EQ(result.assumeValue()->code(), "GBP");
}

/**
 * @given provider over the built-in table
 * @when an unknown code is requested
 * @then kUnknownCurrency is returned and a warning lists supported codes
 */
TEST_F(BuiltinCurrencyProviderTest, WarnsOnUnknownCode) {
  EXPECT_CALL(*log,
              logInternal(logger::LogLevel::kWarn,
                          HasSubstr("supported codes: EUR, USD, GBP")));

  auto result = provider->get("XYZ");
  MONETA_ASSERT_RESULT_ERROR(result);
  EXPECT_EQ(result.assumeError().kind, MoneyError::Kind::kUnknownCurrency);
  EXPECT_EQ(result.assumeError().code, "XYZ");
}

TEST_F(BuiltinCurrencyProviderTest, SupportedCodes) {
  EXPECT_THAT(provider->supportedCodes(),
              ::testing::ElementsAre("EUR", "USD", "GBP"));
}

/**
 * @given logger which filters out every message
 * @when currencies are resolved
 * @then nothing is written
 */
TEST_F(BuiltinCurrencyProviderTest, RespectsLogLevel) {
  EXPECT_CALL(*log, shouldLog(_)).WillRepeatedly(Return(false));
  EXPECT_CALL(*log, logInternal(_, _)).Times(0);

  MONETA_ASSERT_RESULT_VALUE(provider->get("EUR"));
  MONETA_ASSERT_RESULT_ERROR(provider->get("eur"));
}
