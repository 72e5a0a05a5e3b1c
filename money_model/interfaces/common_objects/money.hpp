/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_MONEY_HPP
#define MONETA_MODEL_MONEY_HPP

#include <iosfwd>
#include <string>

#include "common/result.hpp"
#include "interfaces/common_objects/currency.hpp"
#include "interfaces/common_objects/decimal.hpp"
#include "interfaces/common_objects/money_error.hpp"
#include "interfaces/common_objects/types.hpp"

namespace moneta {
  namespace model {

    class Money;

    using MoneyResult = expected::Result<Money, MoneyError>;

    /**
     * Immutable amount of money: an exact number of minor currency units
     * (e.g. cents) bound to one currency for its whole lifetime.
     *
     * Operations combining two values require them to share the currency and
     * report kCurrencyMismatch otherwise; equality never fails and simply
     * compares unequal across currencies.
     */
    class Money final {
     public:
      /**
       * Create Money from a decimal amount of major units. The amount is
       * converted to minor units by multiplying with the currency factor and
       * dropping whatever fraction of a minor unit remains, so 1.999 EUR
       * becomes 199 cents.
       * @param value - amount in major units
       * @param currency - currency to bind to, must not be null
       */
      static Money of(const Decimal &value, types::CurrencyPtr currency);

      /**
       * Create Money from a double. The double is converted to the shortest
       * decimal that reads back as the same double, then passed to of(); no
       * other rounding happens.
       * @return the value, or kInvalidArgument for NaN and infinities
       */
      static MoneyResult fromDouble(double value, types::CurrencyPtr currency);

      /// Zero amount of the given currency
      static Money zero(types::CurrencyPtr currency);

      const Currency &currency() const;

      const types::CurrencyPtr &currencyPtr() const;

      /// Amount in minor units
      const types::BigIntegerType &minorUnits() const;

      bool isSameCurrency(const Money &other) const;

      MoneyResult plus(const Money &other) const;

      /// The difference may be negative
      MoneyResult minus(const Money &other) const;

      Money multiply(types::MultiplierType multiplier) const;

      /**
       * Divide the amount of minor units, truncating towards zero.
       * @return the quotient, or kInvalidArgument when divisor is zero
       */
      MoneyResult divide(types::MultiplierType divisor) const;

      expected::Result<bool, MoneyError> isLessThan(const Money &other) const;

      expected::Result<bool, MoneyError> isGreaterThan(
          const Money &other) const;

      /**
       * Three-way comparison of the amounts.
       * @return -1, 0 or 1, or kCurrencyMismatch
       */
      expected::Result<int, MoneyError> compareTo(const Money &other) const;

      /// Same currency and same amount; never fails
      bool equals(const Money &other) const;

      bool operator==(const Money &other) const;
      bool operator!=(const Money &other) const;

      bool isNegative() const;

      /// Exact amount in major units, e.g. 12.50 for 1250 cents
      Decimal toDecimal() const;

      /**
       * Human readable representation "CCC X.XXX,DD": the currency symbol,
       * a space and the amount formatted with the currency locale, e.g.
       * "EUR 1.000,00" or "USD 1,000.00".
       */
      std::string beautify() const;

      std::string toString() const;

     private:
      Money(types::BigIntegerType minor_units, types::CurrencyPtr currency);

      /// Fails with kCurrencyMismatch unless other shares the currency
      expected::Result<void, MoneyError> requireSameCurrency(
          const Money &other) const;

      types::BigIntegerType minor_units_;
      types::CurrencyPtr currency_;
    };

    std::ostream &operator<<(std::ostream &os, const Money &money);

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_MONEY_HPP
