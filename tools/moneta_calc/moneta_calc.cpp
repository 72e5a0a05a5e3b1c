/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <unordered_map>

#include "backend/builtin/builtin_currency_provider.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "moneta_calc/calculator.hpp"

static const std::unordered_map<std::string, logger::LogLevel> kLogLevels{
    {"trace", logger::LogLevel::kTrace},
    {"debug", logger::LogLevel::kDebug},
    {"info", logger::LogLevel::kInfo},
    {"warning", logger::LogLevel::kWarn},
    {"error", logger::LogLevel::kError},
    {"critical", logger::LogLevel::kCritical}};

static bool validateVerbosity(const char *flagname, const std::string &val) {
  if (val.empty() or kLogLevels.count(val) != 0) {
    return true;
  }
  std::cerr << "Invalid value for " << flagname << ": should be one of";
  for (const auto &level : kLogLevels) {
    std::cerr << " '" << level.first << "'";
  }
  std::cerr << "." << std::endl;
  return false;
}

static bool validateOperation(const char *flagname, const std::string &val) {
  if (moneta::calc::parseOperation(val)) {
    return true;
  }
  std::cerr << "Invalid value for " << flagname << ": " << val << std::endl;
  return false;
}

DEFINE_string(currency, "EUR", "ISO 4217 code of the amount");
DEFINE_string(amount, "0", "Amount in major units, e.g. 100.32");
DEFINE_string(operation,
              "show",
              "One of show, plus, minus, multiply, divide, compare");
DEFINE_validator(operation, &validateOperation);
DEFINE_string(operand,
              "0",
              "Second amount for plus, minus and compare; integer factor for "
              "multiply and divide");
DEFINE_string(operand_currency,
              "",
              "ISO 4217 code of the operand, defaults to --currency");
DEFINE_string(verbosity,
              "",
              "Log verbosity: trace, debug, info, warning, error or "
              "critical; the default level if empty");
DEFINE_validator(verbosity, &validateVerbosity);

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage(
      "Exact money arithmetic, e.g. --currency EUR --amount 100.32 "
      "--operation plus --operand 250.99");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  logger::LoggerConfig log_config;
  log_config.log_level = FLAGS_verbosity.empty()
      ? logger::kDefaultLogLevel
      : kLogLevels.at(FLAGS_verbosity);
  log_config.patterns = logger::getDefaultLogPatterns();
  auto log_manager =
      std::make_shared<logger::LoggerManagerTree>(std::move(log_config));
  auto log = log_manager->getChild("Calc")->getLogger();

  moneta::model::BuiltinCurrencyProvider provider(
      log_manager->getChild("CurrencyProvider")->getLogger());

  moneta::calc::Request request{FLAGS_currency,
                                FLAGS_amount,
                                *moneta::calc::parseOperation(FLAGS_operation),
                                FLAGS_operand,
                                FLAGS_operand_currency};
  log->debug("Evaluating {} of {} {}",
             FLAGS_operation,
             FLAGS_amount,
             FLAGS_currency);
  auto result = moneta::calc::calculate(provider, request);
  gflags::ShutDownCommandLineFlags();

  return result.match(
      [](const auto &value) {
        std::cout << value.value << std::endl;
        return EXIT_SUCCESS;
      },
      [&log](const auto &error) {
        log->error("Calculation failed: {}", error.error);
        return EXIT_FAILURE;
      });
}
