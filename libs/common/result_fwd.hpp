/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_RESULT_FWD_HPP
#define MONETA_RESULT_FWD_HPP

#include <string>

namespace moneta {
  namespace expected {

    struct ValueBase;

    template <typename T>
    struct Value;

    struct ErrorBase;

    template <typename E>
    struct Error;

    class ResultException;

    struct ResultBase;

    template <typename V, typename E = std::string>
    class Result;

  }  // namespace expected
}  // namespace moneta

#endif  // MONETA_RESULT_FWD_HPP
