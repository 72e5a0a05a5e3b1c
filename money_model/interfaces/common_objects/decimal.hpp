/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_DECIMAL_HPP
#define MONETA_MODEL_DECIMAL_HPP

#include <iosfwd>
#include <string>
#include <string_view>

#include "common/result.hpp"
#include "interfaces/common_objects/types.hpp"

namespace moneta {
  namespace model {

    /**
     * Exact signed decimal number: unscaledValue / 10^scale.
     * Comparison operators compare numeric values, so 1.5 == 1.50.
     */
    class Decimal final {
     public:
      /// Rounding applied when a value is narrowed to a smaller scale
      enum class RoundingMode {
        kDown,     ///< towards zero
        kHalfEven  ///< to the nearest neighbour, ties to the even one
      };

      /// Canonical zero with scale 0
      Decimal();

      explicit Decimal(int64_t value);

      Decimal(types::BigIntegerType unscaled_value, types::ScaleType scale);

      /**
       * Parse a decimal in plain ("-12.50") or scientific ("1.5e-3")
       * notation.
       * @return the value or a description of the parse failure
       */
      static expected::Result<Decimal, std::string> fromString(
          std::string_view str);

      /**
       * Convert a double through its shortest round-trip decimal rendering,
       * so 0.1 becomes exactly 0.1 rather than the binary expansion.
       * @return the value or an error for NaN and infinities
       */
      static expected::Result<Decimal, std::string> fromDouble(double value);

      /**
       * Returns a value less than zero if Decimal is negative, a value
       * greater than zero if Decimal is positive, and zero if it is zero.
       */
      int sign() const;

      types::ScaleType scale() const;

      const types::BigIntegerType &unscaledValue() const;

      /// Exact product, keeps the scale
      Decimal multiply(const types::BigIntegerType &multiplier) const;

      /// Integer part, the fraction is dropped (truncation towards zero)
      types::BigIntegerType toBigInteger() const;

      /**
       * Change the scale. Widening is exact; narrowing drops digits using the
       * given rounding mode.
       */
      Decimal setScale(types::ScaleType scale, RoundingMode mode) const;

      /// -1, 0 or 1 as this value is less than, equal to or greater than other
      int compareTo(const Decimal &other) const;

      bool operator==(const Decimal &other) const;
      bool operator!=(const Decimal &other) const;
      bool operator<(const Decimal &other) const;
      bool operator>(const Decimal &other) const;

      /**
       * Plain notation with exactly scale() fraction digits, e.g. "-0.05"
       */
      std::string toStringRepr() const;

      std::string toString() const;

     private:
      types::BigIntegerType unscaled_value_;
      types::ScaleType scale_;
    };

    std::ostream &operator<<(std::ostream &os, const Decimal &decimal);

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_DECIMAL_HPP
