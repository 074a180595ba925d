#include "vidup/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace vidup {

Result<void> configure_logging(const std::string& level, const std::string& pattern) {
    spdlog::level::level_enum parsed;
    if (level == "trace") {
        parsed = spdlog::level::trace;
    } else if (level == "debug") {
        parsed = spdlog::level::debug;
    } else if (level == "info") {
        parsed = spdlog::level::info;
    } else if (level == "warn" || level == "warning") {
        parsed = spdlog::level::warn;
    } else if (level == "error") {
        parsed = spdlog::level::err;
    } else if (level == "off") {
        parsed = spdlog::level::off;
    } else {
        return Err<void>("Unknown log level: " + level);
    }

    spdlog::set_level(parsed);
    spdlog::set_pattern(pattern.empty() ? std::string(kDefaultLogPattern) : pattern);
    return Ok();
}

} // namespace vidup
