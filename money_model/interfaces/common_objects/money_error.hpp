/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_MONEY_ERROR_HPP
#define MONETA_MODEL_MONEY_ERROR_HPP

#include <iosfwd>
#include <string>
#include <string_view>

namespace moneta {
  namespace model {

    /**
     * Failure of a currency lookup or of a Money operation.
     * Retrying with the same input always fails the same way.
     */
    struct MoneyError {
      enum class Kind {
        kUnknownCurrency,   ///< code is absent from the currency table
        kCurrencyMismatch,  ///< operands are bound to different currencies
        kInvalidArgument    ///< e.g. division by zero
      };

      MoneyError(Kind kind, std::string description, std::string code = {});

      /// @param code - the rejected currency code
      static MoneyError unknownCurrency(std::string_view code);

      static MoneyError currencyMismatch(std::string_view lhs_code,
                                         std::string_view rhs_code);

      static MoneyError invalidArgument(std::string description);

      bool operator==(const MoneyError &other) const;

      std::string toString() const;

      Kind kind;
      std::string description;
      /// Offending currency code for kUnknownCurrency, empty otherwise
      std::string code;
    };

    std::string_view toString(MoneyError::Kind kind);

    std::ostream &operator<<(std::ostream &os, const MoneyError &error);

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_MONEY_ERROR_HPP
