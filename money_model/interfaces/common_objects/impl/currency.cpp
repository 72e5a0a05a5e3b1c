/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/currency.hpp"

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>
#include "utils/string_builder.hpp"

using namespace moneta;
using namespace moneta::model;

namespace {

  types::FactorType factorOf(types::ScaleType minor_digits) {
    types::FactorType factor = 1;
    for (types::ScaleType i = 0; i < minor_digits; ++i) {
      factor *= 10;
    }
    return factor;
  }

}  // namespace

Currency::Currency(types::CurrencyCodeType code,
                   types::ScaleType minor_digits,
                   Locale locale)
    : code_(std::move(code)),
      minor_digits_(minor_digits),
      factor_(factorOf(minor_digits)),
      locale_(std::move(locale)) {}

const std::vector<types::CurrencyPtr> &Currency::builtinTable() {
  static const std::vector<types::CurrencyPtr> kTable{
      types::CurrencyPtr(new Currency("EUR", 2, Locale::germany())),
      types::CurrencyPtr(new Currency("USD", 2, Locale::us())),
      types::CurrencyPtr(new Currency("GBP", 2, Locale::uk())),
  };
  return kTable;
}

expected::Result<types::CurrencyPtr, MoneyError> Currency::of(
    std::string_view code) {
  const auto &table = builtinTable();
  auto it = std::find_if(
      table.begin(), table.end(), [code](const types::CurrencyPtr &currency) {
        return currency->code() == code;
      });
  if (it == table.end()) {
    return expected::makeError(MoneyError::unknownCurrency(code));
  }
  return expected::makeValue(*it);
}

std::vector<types::CurrencyCodeType> Currency::builtinCodes() {
  std::vector<types::CurrencyCodeType> codes;
  for (const auto &currency : builtinTable()) {
    codes.push_back(currency->code());
  }
  return codes;
}

const types::CurrencyCodeType &Currency::code() const {
  return code_;
}

const std::string &Currency::symbol() const {
  return code_;
}

types::ScaleType Currency::minorDigits() const {
  return minor_digits_;
}

types::FactorType Currency::factor() const {
  return factor_;
}

const Locale &Currency::locale() const {
  return locale_;
}

DecimalFormat Currency::currencyFormat() const {
  return DecimalFormat(locale_, minor_digits_, minor_digits_);
}

bool Currency::isSameCurrency(const Currency &other) const {
  return boost::algorithm::iequals(code_, other.code_);
}

bool Currency::operator==(const Currency &other) const {
  return isSameCurrency(other);
}

bool Currency::operator!=(const Currency &other) const {
  return not(*this == other);
}

std::string Currency::toString() const {
  return detail::PrettyStringBuilder()
      .init("Currency")
      .appendNamed("code", code_)
      .appendNamed("minor_digits", minor_digits_)
      .appendNamed("factor", factor_)
      .appendNamed("locale", locale_.tag())
      .finalize();
}
