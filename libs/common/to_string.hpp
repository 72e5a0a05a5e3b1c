/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_LIBS_TO_STRING_HPP
#define MONETA_LIBS_TO_STRING_HPP

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include <boost/optional.hpp>

namespace moneta {
  namespace to_string {
    namespace detail {
      const std::string kBeginBlockMarker = "[";
      const std::string kEndBlockMarker = "]";
      const std::string kSingleFieldsSeparator = ", ";
      const std::string kNotSet = "(not set)";

      /// Print pointers and optionals.
      template <typename T>
      inline std::string toStringDereferenced(const T &o);
    }  // namespace detail

    inline std::string toString(std::string const &o) {
      return o;
    }

    inline std::string toString(std::string_view o) {
      return std::string{o};
    }

    inline std::string toString(const char *o) {
      return std::string{o};
    }

    template <typename T>
    inline auto toString(const T &o) -> std::enable_if_t<
        std::is_same<decltype(std::to_string(o)), std::string>::value,
        std::string> {
      return std::to_string(o);
    }

    template <typename T>
    inline auto toString(const T &o) -> std::enable_if_t<
        std::is_same<typename std::decay_t<decltype(o.toString())>,
                     std::string>::value,
        std::string> {
      return o.toString();
    }

    template <typename... T>
    inline std::string toString(const std::shared_ptr<T...> &o) {
      return detail::toStringDereferenced(o);
    }

    template <typename T>
    inline std::string toString(const boost::optional<T> &o) {
      return detail::toStringDereferenced(o);
    }

    namespace detail {
      template <typename T>
      inline std::string toStringDereferenced(const T &o) {
        if (o) {
          return ::moneta::to_string::toString(*o);
        } else {
          return kNotSet;
        }
      }
    }  // namespace detail
  }    // namespace to_string
}  // namespace moneta

#endif  // MONETA_LIBS_TO_STRING_HPP
