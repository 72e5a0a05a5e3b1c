/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/money.hpp"

#include <ostream>

#include <fmt/format.h>
#include "utils/string_builder.hpp"

using namespace moneta;
using namespace moneta::model;

Money::Money(types::BigIntegerType minor_units, types::CurrencyPtr currency)
    : minor_units_(std::move(minor_units)), currency_(std::move(currency)) {}

Money Money::of(const Decimal &value, types::CurrencyPtr currency) {
  auto minor_units =
      value.multiply(types::BigIntegerType(currency->factor())).toBigInteger();
  return Money(std::move(minor_units), std::move(currency));
}

MoneyResult Money::fromDouble(double value, types::CurrencyPtr currency) {
  return Decimal::fromDouble(value).match(
      [&currency](auto &&decimal) -> MoneyResult {
        return expected::makeValue(of(decimal.value, std::move(currency)));
      },
      [](auto &&error) -> MoneyResult {
        return expected::makeError(
            MoneyError::invalidArgument(std::move(error.error)));
      });
}

Money Money::zero(types::CurrencyPtr currency) {
  return Money(types::BigIntegerType(0), std::move(currency));
}

const Currency &Money::currency() const {
  return *currency_;
}

const types::CurrencyPtr &Money::currencyPtr() const {
  return currency_;
}

const types::BigIntegerType &Money::minorUnits() const {
  return minor_units_;
}

bool Money::isSameCurrency(const Money &other) const {
  return currency_->isSameCurrency(*other.currency_);
}

expected::Result<void, MoneyError> Money::requireSameCurrency(
    const Money &other) const {
  if (not isSameCurrency(other)) {
    return expected::makeError(MoneyError::currencyMismatch(
        currency_->code(), other.currency_->code()));
  }
  return expected::makeValue();
}

MoneyResult Money::plus(const Money &other) const {
  return requireSameCurrency(other) | [&] {
    return Money(minor_units_ + other.minor_units_, currency_);
  };
}

MoneyResult Money::minus(const Money &other) const {
  return requireSameCurrency(other) | [&] {
    return Money(minor_units_ - other.minor_units_, currency_);
  };
}

Money Money::multiply(types::MultiplierType multiplier) const {
  return Money(minor_units_ * multiplier, currency_);
}

MoneyResult Money::divide(types::MultiplierType divisor) const {
  if (divisor == 0) {
    return expected::makeError(MoneyError::invalidArgument(
        fmt::format("Cannot divide {} by zero", currency_->code())));
  }
  return expected::makeValue(Money(minor_units_ / divisor, currency_));
}

expected::Result<bool, MoneyError> Money::isLessThan(
    const Money &other) const {
  return compareTo(other) | [](int order) { return order < 0; };
}

expected::Result<bool, MoneyError> Money::isGreaterThan(
    const Money &other) const {
  return compareTo(other) | [](int order) { return order > 0; };
}

expected::Result<int, MoneyError> Money::compareTo(const Money &other) const {
  return requireSameCurrency(other) | [&] {
    const int order = minor_units_.compare(other.minor_units_);
    return (order > 0) - (order < 0);
  };
}

bool Money::equals(const Money &other) const {
  return isSameCurrency(other) and minor_units_ == other.minor_units_;
}

bool Money::operator==(const Money &other) const {
  return equals(other);
}

bool Money::operator!=(const Money &other) const {
  return not equals(other);
}

bool Money::isNegative() const {
  return minor_units_.sign() < 0;
}

Decimal Money::toDecimal() const {
  if (minor_units_.is_zero()) {
    return Decimal();
  }
  return Decimal(minor_units_, currency_->minorDigits());
}

std::string Money::beautify() const {
  return fmt::format("{} {}",
                     currency_->symbol(),
                     currency_->currencyFormat().format(toDecimal()));
}

std::string Money::toString() const {
  return detail::PrettyStringBuilder()
      .init("Money")
      .appendNamed("amount", toDecimal().toStringRepr())
      .appendNamed("currency", currency_->code())
      .finalize();
}

std::ostream &moneta::model::operator<<(std::ostream &os, const Money &money) {
  return os << money.beautify();
}
