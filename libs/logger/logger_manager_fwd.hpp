/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_LOGGER_MANAGER_FWD_HPP
#define MONETA_LOGGER_MANAGER_FWD_HPP

#include <memory>

namespace logger {

  struct LoggerConfig;
  using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

  class LoggerManagerTree;
  using LoggerManagerTreePtr = std::shared_ptr<LoggerManagerTree>;

}  // namespace logger

#endif  // MONETA_LOGGER_MANAGER_FWD_HPP
