#pragma once

#include "vidup/core/result.hpp"

#include <string>

namespace vidup {

constexpr const char* kDefaultLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Apply a level name and pattern to the default spdlog logger
 *
 * Accepted levels: trace, debug, info, warn, error, off.
 */
Result<void> configure_logging(const std::string& level,
                               const std::string& pattern = kDefaultLogPattern);

} // namespace vidup
