/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/string_builder.hpp"

namespace moneta {
  namespace detail {

    const std::string PrettyStringBuilder::kBeginBlockMarker = "[";
    const std::string PrettyStringBuilder::kEndBlockMarker = "]";
    const std::string PrettyStringBuilder::kKeyValueSeparator = "=";
    const std::string PrettyStringBuilder::kSingleFieldsSeparator = ", ";
    const std::string PrettyStringBuilder::kInitSeparator = ": ";

    PrettyStringBuilder &PrettyStringBuilder::init(const std::string &name) {
      result_.append(name);
      result_.append(kInitSeparator);
      result_.append(kBeginBlockMarker);
      need_field_separator_ = false;
      return *this;
    }

    PrettyStringBuilder &PrettyStringBuilder::append(const std::string &o) {
      separate();
      result_.append(o);
      need_field_separator_ = true;
      return *this;
    }

    std::string PrettyStringBuilder::finalize() {
      result_.append(kEndBlockMarker);
      return std::move(result_);
    }

    void PrettyStringBuilder::separate() {
      if (need_field_separator_) {
        result_.append(kSingleFieldsSeparator);
      }
    }

  }  // namespace detail
}  // namespace moneta
