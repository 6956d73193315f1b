#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace msms {

static constexpr const char *LOGGER_NAME = "msms";

// Shared "msms" logger writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts trace, debug, info, warn (or warning), error, critical, off.
// Throws ConfigError for anything else.
spdlog::level::level_enum parse_log_level(const std::string &level);

// Set the level of the shared logger. Throws ConfigError.
void set_log_level(const std::string &level);

} // namespace msms
