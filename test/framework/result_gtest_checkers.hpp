/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_RESULT_GTEST_CHECKERS_HPP
#define MONETA_RESULT_GTEST_CHECKERS_HPP

#include "common/result.hpp"

#include <gtest/gtest.h>
#include "common/to_string.hpp"

namespace framework {
  namespace expected {
    namespace detail {
      template <typename V, typename E>
      inline std::string getValueMessage(
          const moneta::expected::Result<V, E> &r) {
        return moneta::to_string::toString(r.assumeValue());
      }

      template <typename E>
      inline std::string getValueMessage(
          const moneta::expected::Result<void, E> &) {
        return "void value";
      }

      template <typename V, typename E>
      inline std::string getErrorMessage(
          const moneta::expected::Result<V, E> &r) {
        return moneta::to_string::toString(r.assumeError());
      }

      template <typename V, typename E>
      inline void assertResultValue(const moneta::expected::Result<V, E> &r) {
        ASSERT_TRUE(moneta::expected::hasValue(r))
            << "Value expected, but got error: " << detail::getErrorMessage(r);
      }

      template <typename V, typename E>
      inline void assertResultError(const moneta::expected::Result<V, E> &r) {
        ASSERT_TRUE(moneta::expected::hasError(r))
            << "Error expected, but got value: " << detail::getValueMessage(r);
      }
    }  // namespace detail

    template <typename V, typename E>
    inline void expectResultValue(const moneta::expected::Result<V, E> &r) {
      EXPECT_TRUE(moneta::expected::hasValue(r))
          << "Value expected, but got error: " << detail::getErrorMessage(r);
    }

    template <typename V, typename E>
    inline void expectResultError(const moneta::expected::Result<V, E> &r) {
      EXPECT_TRUE(moneta::expected::hasError(r))
          << "Error expected, but got value: " << detail::getValueMessage(r);
    }
  }  // namespace expected
}  // namespace framework

#define MONETA_ASSERT_RESULT_VALUE(result) \
  ASSERT_NO_FATAL_FAILURE(                 \
      ::framework::expected::detail::assertResultValue(result))

#define MONETA_ASSERT_RESULT_ERROR(result) \
  ASSERT_NO_FATAL_FAILURE(                 \
      ::framework::expected::detail::assertResultError(result))

#endif  // MONETA_RESULT_GTEST_CHECKERS_HPP
