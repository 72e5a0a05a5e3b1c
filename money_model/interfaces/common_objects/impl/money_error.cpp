/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/money_error.hpp"

#include <ostream>

#include <fmt/format.h>
#include "utils/string_builder.hpp"

namespace moneta {
  namespace model {

    MoneyError::MoneyError(Kind kind, std::string description, std::string code)
        : kind(kind),
          description(std::move(description)),
          code(std::move(code)) {}

    MoneyError MoneyError::unknownCurrency(std::string_view code) {
      return MoneyError(Kind::kUnknownCurrency,
                        fmt::format("Currency with code {} is unknown. Please "
                                    "check the list of available currencies.",
                                    code),
                        std::string{code});
    }

    MoneyError MoneyError::currencyMismatch(std::string_view lhs_code,
                                            std::string_view rhs_code) {
      return MoneyError(
          Kind::kCurrencyMismatch,
          fmt::format("Currencies do not match: {} and {}", lhs_code, rhs_code));
    }

    MoneyError MoneyError::invalidArgument(std::string description) {
      return MoneyError(Kind::kInvalidArgument, std::move(description));
    }

    bool MoneyError::operator==(const MoneyError &other) const {
      return kind == other.kind and description == other.description
          and code == other.code;
    }

    std::string MoneyError::toString() const {
      auto builder = detail::PrettyStringBuilder().init("MoneyError");
      builder.appendNamed("kind", std::string{model::toString(kind)})
          .appendNamed("description", description);
      if (not code.empty()) {
        builder.appendNamed("code", code);
      }
      return builder.finalize();
    }

    std::string_view toString(MoneyError::Kind kind) {
      switch (kind) {
        case MoneyError::Kind::kUnknownCurrency:
          return "UnknownCurrency";
        case MoneyError::Kind::kCurrencyMismatch:
          return "CurrencyMismatch";
        case MoneyError::Kind::kInvalidArgument:
          return "InvalidArgument";
      }
      return "Unknown";
    }

    std::ostream &operator<<(std::ostream &os, const MoneyError &error) {
      return os << error.toString();
    }

  }  // namespace model
}  // namespace moneta
