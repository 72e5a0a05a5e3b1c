/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_CURRENCY_PROVIDER_HPP
#define MONETA_MODEL_CURRENCY_PROVIDER_HPP

#include <string_view>
#include <vector>

#include "common/result.hpp"
#include "interfaces/common_objects/currency.hpp"
#include "interfaces/common_objects/money_error.hpp"
#include "interfaces/common_objects/types.hpp"

namespace moneta {
  namespace model {

    /**
     * Source of currency descriptors. Code that needs to resolve currencies
     * by code depends on this interface rather than on a concrete table.
     */
    class CurrencyProvider {
     public:
      using CurrencyResult = expected::Result<types::CurrencyPtr, MoneyError>;

      virtual ~CurrencyProvider() = default;

      /**
       * Resolve a currency code
       * @param code - ISO 4217 code
       * @return the descriptor, or kUnknownCurrency carrying the code
       */
      virtual CurrencyResult get(std::string_view code) const = 0;

      /// Codes get() resolves
      virtual std::vector<types::CurrencyCodeType> supportedCodes() const = 0;
    };

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_CURRENCY_PROVIDER_HPP
