/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_CALC_CALCULATOR_HPP
#define MONETA_CALC_CALCULATOR_HPP

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include "common/result.hpp"
#include "interfaces/currency/currency_provider.hpp"

namespace moneta {
  namespace calc {

    enum class Operation { kShow, kPlus, kMinus, kMultiply, kDivide, kCompare };

    /// Names accepted by parseOperation(), in declaration order
    const std::vector<std::string> &operationNames();

    boost::optional<Operation> parseOperation(const std::string &name);

    struct Request {
      std::string currency;
      /// Decimal string in major units
      std::string amount;
      Operation operation;
      /// Decimal string for plus, minus and compare; integer otherwise
      std::string operand;
      /// Empty means the currency of the amount
      std::string operand_currency;
    };

    /**
     * Evaluate the request
     * @return beautified money, or -1/0/1 for compare; a readable message on
     * failure
     */
    expected::Result<std::string, std::string> calculate(
        const model::CurrencyProvider &provider, const Request &request);

  }  // namespace calc
}  // namespace moneta

#endif  // MONETA_CALC_CALCULATOR_HPP
