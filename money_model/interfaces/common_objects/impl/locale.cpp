/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "interfaces/common_objects/locale.hpp"

#include "utils/string_builder.hpp"

using namespace moneta::model;

Locale::Locale(std::string tag,
               std::string grouping_separator,
               std::string decimal_separator,
               std::size_t grouping_size)
    : tag_(std::move(tag)),
      grouping_separator_(std::move(grouping_separator)),
      decimal_separator_(std::move(decimal_separator)),
      grouping_size_(grouping_size) {}

const Locale &Locale::germany() {
  static const Locale kGermany("de-DE", ".", ",");
  return kGermany;
}

const Locale &Locale::us() {
  static const Locale kUs("en-US", ",", ".");
  return kUs;
}

const Locale &Locale::uk() {
  static const Locale kUk("en-GB", ",", ".");
  return kUk;
}

const std::string &Locale::tag() const {
  return tag_;
}

const std::string &Locale::groupingSeparator() const {
  return grouping_separator_;
}

const std::string &Locale::decimalSeparator() const {
  return decimal_separator_;
}

std::size_t Locale::groupingSize() const {
  return grouping_size_;
}

bool Locale::operator==(const Locale &other) const {
  return tag_ == other.tag_ and grouping_separator_ == other.grouping_separator_
      and decimal_separator_ == other.decimal_separator_
      and grouping_size_ == other.grouping_size_;
}

std::string Locale::toString() const {
  return moneta::detail::PrettyStringBuilder()
      .init("Locale")
      .appendNamed("tag", tag_)
      .appendNamed("grouping", grouping_separator_)
      .appendNamed("decimal", decimal_separator_)
      .finalize();
}
