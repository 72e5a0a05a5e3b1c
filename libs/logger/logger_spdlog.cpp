/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_spdlog.hpp"

#include <iterator>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

  const std::string kDefaultPattern =
      "[%Y-%m-%d %H:%M:%S.%F][th:%t][%=8l][%n]: %v";

  spdlog::level::level_enum getSpdlogLogLevel(logger::LogLevel level) {
    switch (level) {
      case logger::LogLevel::kTrace:
        return spdlog::level::trace;
      case logger::LogLevel::kDebug:
        return spdlog::level::debug;
      case logger::LogLevel::kInfo:
        return spdlog::level::info;
      case logger::LogLevel::kWarn:
        return spdlog::level::warn;
      case logger::LogLevel::kError:
        return spdlog::level::err;
      case logger::LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::info;
  }

  /// Every logger owns its sink, as the pattern is a property of the sink.
  std::shared_ptr<spdlog::logger> makeLogger(const std::string &tag) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    return std::make_shared<spdlog::logger>(tag, std::move(console_sink));
  }

}  // namespace

namespace logger {

  void LogPatterns::setPattern(LogLevel level, std::string pattern) {
    patterns_[level] = std::move(pattern);
  }

  std::string LogPatterns::getPattern(LogLevel level) const {
    auto it = patterns_.upper_bound(level);
    if (it == patterns_.begin()) {
      return kDefaultPattern;
    }
    return std::prev(it)->second;
  }

  LogPatterns getDefaultLogPatterns() {
    LogPatterns patterns;
    patterns.setPattern(LogLevel::kTrace, kDefaultPattern);
    return patterns;
  }

  LoggerSpdlog::LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config)
      : tag_(std::move(tag)),
        config_(std::move(config)),
        logger_(makeLogger(tag_)) {
    setupLogger();
  }

  void LoggerSpdlog::setupLogger() {
    logger_->set_level(getSpdlogLogLevel(config_->log_level));
    logger_->set_pattern(config_->patterns.getPattern(config_->log_level));
  }

  void LoggerSpdlog::logInternal(Level level, const std::string &s) const {
    logger_->log(getSpdlogLogLevel(level), s);
  }

  bool LoggerSpdlog::shouldLog(Level level) const {
    return config_->log_level <= level;
  }

}  // namespace logger
