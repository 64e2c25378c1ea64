#include "common/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace whoisit {

bool initLogging(const LoggingConfig& config) {
	std::vector<spdlog::sink_ptr> sinks;
	sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

	std::string fileError;
	if (!config.filePath.empty()) {
		try {
			sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.filePath, config.maxFileSize, config.maxFiles));
		} catch (const spdlog::spdlog_ex& e) {
			fileError = e.what();
		}
	}

	auto logger = std::make_shared<spdlog::logger>("whoisit", sinks.begin(), sinks.end());
	logger->set_level(config.level);
	logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
	logger->flush_on(spdlog::level::warn);
	spdlog::set_default_logger(std::move(logger));

	if (!fileError.empty()) {
		spdlog::error("Could not open log file '{}': {}", config.filePath, fileError);
		return false;
	}
	return true;
}

bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lower == "warning") {
		lower = "warn";
	}

	// from_str maps unknown names to `off`, so only accept `off` when it was asked for.
	const spdlog::level::level_enum level = spdlog::level::from_str(lower);
	if (level == spdlog::level::off && lower != "off") {
		return false;
	}
	out = level;
	return true;
}

} // namespace whoisit
