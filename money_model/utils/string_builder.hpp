/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_MODEL_STRING_BUILDER_HPP
#define MONETA_MODEL_STRING_BUILDER_HPP

#include <string>

#include "common/to_string.hpp"

namespace moneta {
  namespace detail {
    /**
     * Builds the debug representations of model objects, e.g.
     * "Money: [amount=1000, currency=EUR]"
     */
    class PrettyStringBuilder {
     public:
      /**
       * Initializes new string with a provided name
       * @param name - name to initialize
       */
      PrettyStringBuilder &init(const std::string &name);

      PrettyStringBuilder &append(const std::string &o);

      template <typename T>
      PrettyStringBuilder &append(const T &o) {
        return append(::moneta::to_string::toString(o));
      }

      /**
       * Appends new field to string as a "name=value" pair
       * @param name - field name to append
       * @param value - field value
       */
      template <typename Value>
      PrettyStringBuilder &appendNamed(const std::string &name,
                                       const Value &value) {
        separate();
        result_.append(name);
        result_.append(kKeyValueSeparator);
        result_.append(::moneta::to_string::toString(value));
        need_field_separator_ = true;
        return *this;
      }

      /**
       * Finalizes appending and returns constructed string.
       * @return resulted string
       */
      std::string finalize();

     private:
      void separate();

      std::string result_;
      bool need_field_separator_ = false;

      static const std::string kBeginBlockMarker;
      static const std::string kEndBlockMarker;
      static const std::string kKeyValueSeparator;
      static const std::string kSingleFieldsSeparator;
      static const std::string kInitSeparator;
    };
  }  // namespace detail
}  // namespace moneta

#endif  // MONETA_MODEL_STRING_BUILDER_HPP
