/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "moneta_calc/calculator.hpp"

#include "interfaces/common_objects/money.hpp"

using moneta::model::Decimal;
using moneta::model::Money;
using moneta::model::MoneyError;

namespace {

  using CalcResult = moneta::expected::Result<std::string, std::string>;

  template <typename V>
  moneta::expected::Result<V, std::string> describeError(
      moneta::expected::Result<V, MoneyError> result) {
    return std::move(result).match(
        [](auto &&value) -> moneta::expected::Result<V, std::string> {
          return moneta::expected::makeValue(std::move(value.value));
        },
        [](auto &&error) -> moneta::expected::Result<V, std::string> {
          return moneta::expected::makeError(error.error.description);
        });
  }

  moneta::expected::Result<Money, std::string> parseMoney(
      const moneta::model::CurrencyProvider &provider,
      const std::string &amount,
      const std::string &code) {
    return Decimal::fromString(amount) | [&](const Decimal &decimal) {
      return describeError(provider.get(code)) |
          [&](const moneta::model::types::CurrencyPtr &currency) {
            return Money::of(decimal, currency);
          };
    };
  }

  moneta::expected::Result<int64_t, std::string> parseInteger(
      const std::string &value) {
    try {
      std::size_t parsed = 0;
      auto integer = std::stoll(value, &parsed);
      if (parsed == value.size()) {
        return moneta::expected::makeValue(static_cast<int64_t>(integer));
      }
    } catch (const std::exception &) {
      // reported below
    }
    return moneta::expected::makeError("'" + value + "' is not an integer");
  }

}  // namespace

namespace moneta {
  namespace calc {

    const std::vector<std::string> &operationNames() {
      static const std::vector<std::string> kNames{
          "show", "plus", "minus", "multiply", "divide", "compare"};
      return kNames;
    }

    boost::optional<Operation> parseOperation(const std::string &name) {
      const auto &names = operationNames();
      for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
          return static_cast<Operation>(i);
        }
      }
      return boost::none;
    }

    expected::Result<std::string, std::string> calculate(
        const model::CurrencyProvider &provider, const Request &request) {
      const auto &operand_currency = request.operand_currency.empty()
          ? request.currency
          : request.operand_currency;

      return parseMoney(provider, request.amount, request.currency) |
          [&](const Money &money) -> CalcResult {
        auto with_operand = [&](auto &&operation) {
          return parseMoney(provider, request.operand, operand_currency) |
              [&](const Money &operand) {
                return describeError(operation(operand));
              };
        };
        auto with_factor = [&](auto &&operation) {
          return parseInteger(request.operand) | operation;
        };
        auto beautify = [](const Money &result) { return result.beautify(); };

        switch (request.operation) {
          case Operation::kPlus:
            return with_operand([&](const Money &operand) {
                     return money.plus(operand);
                   })
                | beautify;
          case Operation::kMinus:
            return with_operand([&](const Money &operand) {
                     return money.minus(operand);
                   })
                | beautify;
          case Operation::kCompare:
            return with_operand([&](const Money &operand) {
                     return money.compareTo(operand);
                   })
                | [](int order) { return std::to_string(order); };
          case Operation::kMultiply:
            return with_factor([&](int64_t factor) {
              return money.multiply(factor).beautify();
            });
          case Operation::kDivide:
            return with_factor([&](int64_t divisor) {
              return describeError(money.divide(divisor)) | beautify;
            });
          case Operation::kShow:
            break;
        }
        return expected::makeValue(money.beautify());
      };
    }

  }  // namespace calc
}  // namespace moneta
