/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_DECIMAL_FORMAT_HPP
#define MONETA_MODEL_DECIMAL_FORMAT_HPP

#include <string>

#include "interfaces/common_objects/decimal.hpp"
#include "interfaces/common_objects/locale.hpp"
#include "interfaces/common_objects/types.hpp"

namespace moneta {
  namespace model {

    /**
     * Locale aware rendering of decimals with a bounded number of fraction
     * digits. Values with more fraction digits than the maximum are rounded
     * half-even, values with fewer are padded with zeroes up to the minimum.
     */
    class DecimalFormat final {
     public:
      DecimalFormat(Locale locale,
                    types::ScaleType min_fraction_digits,
                    types::ScaleType max_fraction_digits);

      const Locale &locale() const;

      types::ScaleType minFractionDigits() const;

      types::ScaleType maxFractionDigits() const;

      /**
       * @return grouped integer part, decimal separator and fraction,
       * e.g. "-1.234,50" for de-DE with two fraction digits
       */
      std::string format(const Decimal &value) const;

     private:
      std::string groupIntegerPart(const std::string &digits) const;

      Locale locale_;
      types::ScaleType min_fraction_digits_;
      types::ScaleType max_fraction_digits_;
    };

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_DECIMAL_FORMAT_HPP
