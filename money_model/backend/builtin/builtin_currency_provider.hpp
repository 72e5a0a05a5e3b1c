/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_BUILTIN_CURRENCY_PROVIDER_HPP
#define MONETA_BUILTIN_CURRENCY_PROVIDER_HPP

#include "interfaces/currency/currency_provider.hpp"

#include "logger/logger_fwd.hpp"

namespace moneta {
  namespace model {

    /// Provider over the fixed table of Currency::of()
    class BuiltinCurrencyProvider : public CurrencyProvider {
     public:
      explicit BuiltinCurrencyProvider(logger::LoggerPtr log);

      CurrencyResult get(std::string_view code) const override;

      std::vector<types::CurrencyCodeType> supportedCodes() const override;

     private:
      logger::LoggerPtr log_;
    };

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_BUILTIN_CURRENCY_PROVIDER_HPP
