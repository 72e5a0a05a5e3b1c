/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_LOCALE_HPP
#define MONETA_MODEL_LOCALE_HPP

#include <cstddef>
#include <string>

namespace moneta {
  namespace model {

    /**
     * Display locale of a currency: a BCP 47 tag together with the number
     * symbols that tag stands for.
     */
    class Locale final {
     public:
      Locale(std::string tag,
             std::string grouping_separator,
             std::string decimal_separator,
             std::size_t grouping_size = 3);

      /// de-DE: 1.234,56
      static const Locale &germany();

      /// en-US: 1,234.56
      static const Locale &us();

      /// en-GB: 1,234.56
      static const Locale &uk();

      const std::string &tag() const;

      const std::string &groupingSeparator() const;

      const std::string &decimalSeparator() const;

      /// Number of integer digits between two grouping separators
      std::size_t groupingSize() const;

      bool operator==(const Locale &other) const;

      std::string toString() const;

     private:
      std::string tag_;
      std::string grouping_separator_;
      std::string decimal_separator_;
      std::size_t grouping_size_;
    };

  }  // namespace model
}  // namespace moneta

#endif  // MONETA_MODEL_LOCALE_HPP
