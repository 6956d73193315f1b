#include "msms_logging.hpp"
#include "DatasetErrors.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace msms {

std::shared_ptr<spdlog::logger> logger() {
	static std::once_flag init_flag;
	std::call_once(init_flag, []() {
		if (!spdlog::get(LOGGER_NAME)) {
			auto created = spdlog::stderr_color_mt(LOGGER_NAME);
			created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
			created->set_level(spdlog::level::info);
		}
	});
	return spdlog::get(LOGGER_NAME);
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
	// spdlog::level::from_str maps unknown names to "off", so validate first
	static const char *names[] = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
	bool known = false;
	for (auto name : names) {
		if (level == name) {
			known = true;
			break;
		}
	}
	if (!known) {
		throw ConfigError("Unknown log level: '" + level + "'");
	}
	return level == "warning" ? spdlog::level::warn : spdlog::level::from_str(level);
}

void set_log_level(const std::string &level) {
	logger()->set_level(parse_log_level(level));
}

} // namespace msms
