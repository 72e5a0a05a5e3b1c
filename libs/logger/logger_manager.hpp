/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MONETA_LOGGER_MANAGER_HPP
#define MONETA_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

#include "logger/logger.hpp"
#include "logger/logger_spdlog.hpp"

namespace logger {

  /**
   * A node of a tree of loggers. Every node owns a logger whose tag is the
   * path from the root, e.g. "moneta/CurrencyProvider", and shares the
   * configuration of the tree.
   */
  class LoggerManagerTree {
   public:
    explicit LoggerManagerTree(ConstLoggerConfigPtr config);

    explicit LoggerManagerTree(LoggerConfig config);

    /// Get this node's logger.
    LoggerPtr getLogger();

    /**
     * Get a child node, creating it on the first request.
     * @param tag - the child's own tag, appended to this node's tag
     */
    LoggerManagerTreePtr getChild(const std::string &tag);

   private:
    LoggerManagerTree(std::string full_tag, ConstLoggerConfigPtr config);

    const std::string full_tag_;
    const ConstLoggerConfigPtr config_;

    std::mutex mutex_;
    LoggerPtr logger_;
    std::unordered_map<std::string, LoggerManagerTreePtr> children_;
  };

}  // namespace logger

#endif  // MONETA_LOGGER_MANAGER_HPP
