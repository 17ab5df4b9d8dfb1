// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/common/logging.h"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hcert::common {

std::shared_ptr<spdlog::logger> Logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }

    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return logger;
}

bool SetLogLevel(std::string_view level) {
  const auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to off; only accept "off" when it was asked for.
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }

  Logger()->set_level(parsed);
  return true;
}

} // namespace hcert::common
