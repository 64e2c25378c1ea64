#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <string>

namespace whoisit {

//! Logging sinks and verbosity.
struct LoggingConfig {
	spdlog::level::level_enum level{spdlog::level::info}; //!< Minimum level written to every sink.
	std::string filePath{};                                 //!< Rotating log file. Empty -> console only.
	std::size_t maxFileSize{100u * 1024u * 1024u};          //!< Rotate once the file reaches this size (bytes).
	std::size_t maxFiles{2u};                               //!< Number of rotated files kept next to the active one.
};

//! Install the process wide default logger. Safe to call again to reconfigure.
//! \returns False if the file sink could not be opened. The console sink is installed regardless.
bool initLogging(const LoggingConfig& config = LoggingConfig{});

//! Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
//! \returns False and leaves `out` untouched for unknown names.
bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out);

} // namespace whoisit
