/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "backend/builtin/builtin_currency_provider.hpp"

#include <boost/algorithm/string/join.hpp>
#include "logger/logger.hpp"

using namespace moneta::model;

BuiltinCurrencyProvider::BuiltinCurrencyProvider(logger::LoggerPtr log)
    : log_(std::move(log)) {}

CurrencyProvider::CurrencyResult BuiltinCurrencyProvider::get(
    std::string_view code) const {
  auto result = Currency::of(code);
  result.match(
      [this](const auto &currency) {
        log_->debug("Resolved currency {}", *currency.value);
      },
      [this](const auto &error) {
        log_->warn("{}; supported codes: {}",
                   error.error.description,
                   boost::algorithm::join(supportedCodes(), ", "));
      });
  return result;
}

std::vector<moneta::model::types::CurrencyCodeType>
BuiltinCurrencyProvider::supportedCodes() const {
  return Currency::builtinCodes();
}
