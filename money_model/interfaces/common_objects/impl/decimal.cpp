/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/decimal.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>

#include <fmt/format.h>
#include <boost/algorithm/string/classification.hpp>
#include "utils/string_builder.hpp"

static const char kDecimalSeparator = '.';
static const char *kDigits = "0123456789";
static const char kZero = kDigits[0];
static const char kMinus = '-';
static const char kPlus = '+';
static const int64_t kMaxExponent = 1000;

using namespace moneta;
using namespace moneta::model;

namespace {

  types::BigIntegerType powerOfTen(types::ScaleType exponent) {
    return boost::multiprecision::pow(types::BigIntegerType(10), exponent);
  }

  expected::Result<Decimal, std::string> parseError(std::string_view str,
                                                    std::string_view reason) {
    return expected::makeError(
        fmt::format("Could not parse '{}' as a decimal: {}", str, reason));
  }

}  // namespace

Decimal::Decimal() : unscaled_value_(0), scale_(0) {}

Decimal::Decimal(int64_t value) : unscaled_value_(value), scale_(0) {}

Decimal::Decimal(types::BigIntegerType unscaled_value, types::ScaleType scale)
    : unscaled_value_(std::move(unscaled_value)), scale_(scale) {}

expected::Result<Decimal, std::string> Decimal::fromString(
    std::string_view str) {
  static const auto is_digit = boost::is_any_of(kDigits);

  const char *pos = str.data();
  const char *const end = pos + str.size();

  bool negative = false;
  if (pos != end and (*pos == kMinus or *pos == kPlus)) {
    negative = *pos == kMinus;
    ++pos;
  }

  std::string digits;
  types::ScaleType fraction_digits = 0;
  bool seen_separator = false;
  for (; pos != end; ++pos) {
    if (*pos == kDecimalSeparator) {
      if (seen_separator) {
        return parseError(str, "more than one decimal separator");
      }
      seen_separator = true;
    } else if (is_digit(*pos)) {
      digits.push_back(*pos);
      if (seen_separator) {
        ++fraction_digits;
      }
    } else {
      break;
    }
  }

  if (digits.empty()) {
    return parseError(str, "no digits");
  }

  int64_t exponent = 0;
  if (pos != end) {
    if (*pos != 'e' and *pos != 'E') {
      return parseError(str, fmt::format("unexpected character '{}'", *pos));
    }
    ++pos;
    bool negative_exponent = false;
    if (pos != end and (*pos == kMinus or *pos == kPlus)) {
      negative_exponent = *pos == kMinus;
      ++pos;
    }
    if (pos == end) {
      return parseError(str, "empty exponent");
    }
    for (; pos != end; ++pos) {
      if (not is_digit(*pos)) {
        return parseError(str,
                          fmt::format("unexpected character '{}'", *pos));
      }
      exponent = exponent * 10 + (*pos - kZero);
      if (exponent > kMaxExponent) {
        return parseError(str, "exponent is out of range");
      }
    }
    if (negative_exponent) {
      exponent = -exponent;
    }
  }

  // cpp_int treats a leading zero as an octal prefix
  types::BigIntegerType unscaled_value(0);
  const auto first_nonzero_digit_pos = digits.find_first_not_of(kZero);
  if (first_nonzero_digit_pos != std::string::npos) {
    unscaled_value =
        types::BigIntegerType(digits.substr(first_nonzero_digit_pos));
  }
  if (negative) {
    unscaled_value = -unscaled_value;
  }

  int64_t scale = static_cast<int64_t>(fraction_digits) - exponent;
  if (scale < 0) {
    unscaled_value *= powerOfTen(static_cast<types::ScaleType>(-scale));
    scale = 0;
  }
  return expected::makeValue(
      Decimal(std::move(unscaled_value), static_cast<types::ScaleType>(scale)));
}

expected::Result<Decimal, std::string> Decimal::fromDouble(double value) {
  if (not std::isfinite(value)) {
    return expected::makeError(
        fmt::format("{} has no decimal representation", value));
  }
  return fromString(fmt::format("{}", value));
}

int Decimal::sign() const {
  return unscaled_value_.sign();
}

types::ScaleType Decimal::scale() const {
  return scale_;
}

const types::BigIntegerType &Decimal::unscaledValue() const {
  return unscaled_value_;
}

Decimal Decimal::multiply(const types::BigIntegerType &multiplier) const {
  return Decimal(unscaled_value_ * multiplier, scale_);
}

types::BigIntegerType Decimal::toBigInteger() const {
  if (scale_ == 0) {
    return unscaled_value_;
  }
  return unscaled_value_ / powerOfTen(scale_);
}

Decimal Decimal::setScale(types::ScaleType scale, RoundingMode mode) const {
  if (scale >= scale_) {
    return Decimal(unscaled_value_ * powerOfTen(scale - scale_), scale);
  }

  const types::BigIntegerType divisor = powerOfTen(scale_ - scale);
  types::BigIntegerType quotient = unscaled_value_ / divisor;
  const types::BigIntegerType remainder = unscaled_value_ % divisor;

  if (mode == RoundingMode::kHalfEven and remainder != 0) {
    const types::BigIntegerType twice_remainder =
        boost::multiprecision::abs(remainder) * 2;
    const bool quotient_is_odd = quotient % 2 != 0;
    if (twice_remainder > divisor
        or (twice_remainder == divisor and quotient_is_odd)) {
      quotient += unscaled_value_.sign();
    }
  }
  return Decimal(std::move(quotient), scale);
}

int Decimal::compareTo(const Decimal &other) const {
  const auto common_scale = std::max(scale_, other.scale_);
  const types::BigIntegerType lhs =
      unscaled_value_ * powerOfTen(common_scale - scale_);
  const types::BigIntegerType rhs =
      other.unscaled_value_ * powerOfTen(common_scale - other.scale_);
  if (lhs < rhs) {
    return -1;
  }
  return lhs > rhs ? 1 : 0;
}

bool Decimal::operator==(const Decimal &other) const {
  return compareTo(other) == 0;
}

bool Decimal::operator!=(const Decimal &other) const {
  return not(*this == other);
}

bool Decimal::operator<(const Decimal &other) const {
  return compareTo(other) < 0;
}

bool Decimal::operator>(const Decimal &other) const {
  return compareTo(other) > 0;
}

std::string Decimal::toStringRepr() const {
  const types::BigIntegerType magnitude =
      boost::multiprecision::abs(unscaled_value_);
  auto repr = magnitude.str();
  if (scale_ > 0) {
    if (repr.size() <= scale_) {
      repr.insert(0, scale_ - repr.size() + 1, kZero);
    }
    repr.insert(repr.size() - scale_, 1, kDecimalSeparator);
  }
  if (sign() < 0) {
    repr.insert(0, 1, kMinus);
  }
  return repr;
}

std::string Decimal::toString() const {
  return detail::PrettyStringBuilder()
      .init("Decimal")
      .append(toStringRepr())
      .finalize();
}

std::ostream &moneta::model::operator<<(std::ostream &os,
                                        const Decimal &decimal) {
  return os << decimal.toStringRepr();
}
