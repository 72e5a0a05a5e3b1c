/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_TYPES_HPP
#define MONETA_MODEL_TYPES_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace moneta {
  namespace model {

    class Currency;

    namespace types {
      /// Arbitrary precision signed integer
      using BigIntegerType = boost::multiprecision::cpp_int;
      /// Number of digits after the decimal point
      using ScaleType = uint32_t;
      /// Multiplier between major and minor currency units
      using FactorType = uint64_t;
      /// Three letter currency code, e.g. EUR
      using CurrencyCodeType = std::string;
      /// Integer operand of Money::multiply and Money::divide
      using MultiplierType = int64_t;
      /// Currency descriptors are shared by all values bound to them
      using CurrencyPtr = std::shared_ptr<const Currency>;
    }  // namespace types
  }    // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_TYPES_HPP
