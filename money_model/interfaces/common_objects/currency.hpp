/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_CURRENCY_HPP
#define MONETA_MODEL_CURRENCY_HPP

#include <string>
#include <string_view>
#include <vector>

#include "common/result.hpp"
#include "interfaces/common_objects/decimal_format.hpp"
#include "interfaces/common_objects/locale.hpp"
#include "interfaces/common_objects/money_error.hpp"
#include "interfaces/common_objects/types.hpp"

namespace moneta {
  namespace model {

    /**
     * Immutable descriptor of an ISO 4217 currency. Instances come only from
     * the built-in table, see of().
     */
    class Currency final {
     public:
      /**
       * Look the currency up in the built-in table. The match is exact and
       * case sensitive.
       * @param code - three letter upper case ISO 4217 code, e.g. EUR
       * @return the shared descriptor, or kUnknownCurrency carrying the code
       */
      static expected::Result<types::CurrencyPtr, MoneyError> of(
          std::string_view code);

      /// Codes accepted by of()
      static std::vector<types::CurrencyCodeType> builtinCodes();

      const types::CurrencyCodeType &code() const;

      /// Shown in front of beautified amounts; the code itself
      const std::string &symbol() const;

      /// Number of decimal digits of the minor unit
      types::ScaleType minorDigits() const;

      /// 10^minorDigits()
      types::FactorType factor() const;

      const Locale &locale() const;

      /**
       * Formatting rule with exactly minorDigits() fraction digits and the
       * separators of locale().
       */
      DecimalFormat currencyFormat() const;

      /// Currencies are the same if their codes match ignoring case
      bool isSameCurrency(const Currency &other) const;

      bool operator==(const Currency &other) const;
      bool operator!=(const Currency &other) const;

      std::string toString() const;

     private:
      /// Fixed table in display order, built once
      static const std::vector<types::CurrencyPtr> &builtinTable();

      Currency(types::CurrencyCodeType code,
               types::ScaleType minor_digits,
               Locale locale);

      types::CurrencyCodeType code_;
      types::ScaleType minor_digits_;
      types::FactorType factor_;
      Locale locale_;
    };

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_CURRENCY_HPP
