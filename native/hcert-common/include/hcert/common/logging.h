// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file logging.h
 * @brief Shared spdlog logger used by all hcert modules.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace hcert::common {

inline constexpr const char* kLoggerName = "hcert";

/**
 * @brief Returns the process-wide "hcert" logger, creating it on first use.
 *
 * The logger writes to a colored stdout sink and defaults to the warn level, so library
 * users see nothing unless they opt in with SetLogLevel.
 */
std::shared_ptr<spdlog::logger> Logger();

/**
 * @brief Sets the level of the "hcert" logger.
 * @param level One of trace, debug, info, warn, error, critical, off.
 * @return false (and leaves the level unchanged) when @p level is not recognized.
 */
bool SetLogLevel(std::string_view level);

} // namespace hcert::common
