/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_LOGGER_FWD_HPP
#define MONETA_LOGGER_FWD_HPP

#include <memory>

namespace logger {

  enum class LogLevel;

  class Logger;

  using LoggerPtr = std::shared_ptr<const Logger>;

}  // namespace logger

#endif  // MONETA_LOGGER_FWD_HPP
