/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/decimal_format.hpp"

#include <algorithm>

using namespace moneta::model;

DecimalFormat::DecimalFormat(Locale locale,
                             types::ScaleType min_fraction_digits,
                             types::ScaleType max_fraction_digits)
    : locale_(std::move(locale)),
      min_fraction_digits_(min_fraction_digits),
      max_fraction_digits_(std::max(min_fraction_digits, max_fraction_digits)) {
}

const Locale &DecimalFormat::locale() const {
  return locale_;
}

types::ScaleType DecimalFormat::minFractionDigits() const {
  return min_fraction_digits_;
}

types::ScaleType DecimalFormat::maxFractionDigits() const {
  return max_fraction_digits_;
}

std::string DecimalFormat::format(const Decimal &value) const {
  auto scale = std::min(value.scale(), max_fraction_digits_);
  scale = std::max(scale, min_fraction_digits_);
  const auto rounded = value.setScale(scale, Decimal::RoundingMode::kHalfEven);

  // "-1234.50" -> sign, "1234" and "50"
  auto repr = rounded.toStringRepr();
  const bool negative = rounded.sign() < 0;
  if (negative) {
    repr.erase(0, 1);
  }
  std::string integer_part = repr;
  std::string fraction_part;
  if (scale > 0) {
    integer_part = repr.substr(0, repr.size() - scale - 1);
    fraction_part = repr.substr(repr.size() - scale);
  }

  std::string result;
  if (negative) {
    result.push_back('-');
  }
  result.append(groupIntegerPart(integer_part));
  if (not fraction_part.empty()) {
    result.append(locale_.decimalSeparator());
    result.append(fraction_part);
  }
  return result;
}

std::string DecimalFormat::groupIntegerPart(const std::string &digits) const {
  const auto group = locale_.groupingSize();
  if (group == 0 or digits.size() <= group) {
    return digits;
  }
  std::string result;
  auto leading = digits.size() % group;
  if (leading == 0) {
    leading = group;
  }
  result.append(digits, 0, leading);
  for (auto pos = leading; pos < digits.size(); pos += group) {
    result.append(locale_.groupingSeparator());
    result.append(digits, pos, group);
  }
  return result;
}
