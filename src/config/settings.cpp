#include "config/settings.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <format>
#include <string_view>

namespace whoisit::config {

namespace {

static std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1u);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1u);
	}
	return text;
}

//! Whole string must be a number of type T. Unsigned types reject a sign.
template <typename T>
static bool parseNumber(std::string_view text, T& out) {
	text = trim(text);
	if (text.empty()) {
		return false;
	}

	T value{};
	const char* end       = text.data() + text.size();
	const auto [ptr, err] = std::from_chars(text.data(), end, value);
	if (err != std::errc{} || ptr != end) {
		return false;
	}
	out = value;
	return true;
}

template <typename T>
static void readNumber(const EnvironmentLookup& lookup, const std::string& name, T& target) {
	const auto value = lookup(name);
	if (value && !parseNumber(*value, target)) {
		spdlog::warn("Ignoring {}='{}': not a valid number", name, *value);
	}
}

static void readSeconds(const EnvironmentLookup& lookup, const std::string& name, std::chrono::seconds& target) {
	long long seconds = target.count();
	readNumber(lookup, name, seconds);
	target = std::chrono::seconds{seconds};
}

static void readString(const EnvironmentLookup& lookup, const std::string& name, std::string& target) {
	if (const auto value = lookup(name)) {
		target = std::string(trim(*value));
	}
}

} // namespace

Settings applyEnvironment(const Settings& base, const EnvironmentLookup& lookup) {
	Settings settings = base;
	if (!lookup) {
		return settings;
	}

	// Qualification
	readNumber(lookup, "WHOISIT_CONFIDENCE_THRESHOLD", settings.qualifier.confidenceThreshold);
	readNumber(lookup, "WHOISIT_MIN_FACE_AREA_FRACTION", settings.qualifier.minFaceAreaFraction);
	readNumber(lookup, "WHOISIT_DUPLICATE_MAX_DISTANCE", settings.pool.duplicateMaxDistance);

	if (const auto value = lookup("WHOISIT_DETECTOR")) {
		if (!avatar::parseDetectorBackend(std::string(trim(*value)), settings.detector.backend)) {
			spdlog::warn("Ignoring WHOISIT_DETECTOR='{}': expected skin, cascade or yunet", *value);
		}
	}
	readString(lookup, "WHOISIT_DETECTOR_MODEL", settings.detector.modelPath);

	// Game
	readNumber(lookup, "WHOISIT_CANDIDATE_COUNT", settings.game.candidateCount);
	readNumber(lookup, "WHOISIT_NO_REPEAT_WINDOW", settings.game.noRepeatWindow);
	readSeconds(lookup, "WHOISIT_ROUND_EXPIRY_SECONDS", settings.game.roundExpiry);
	readSeconds(lookup, "WHOISIT_SESSION_IDLE_TIMEOUT_SECONDS", settings.game.sessionIdleTimeout);

	if (const auto value = lookup("WHOISIT_PLAY_COMMAND")) {
		const auto command = trim(*value);
		if (command.empty()) {
			spdlog::warn("Ignoring empty WHOISIT_PLAY_COMMAND");
		} else {
			settings.game.playCommand = std::string(command);
		}
	}

	// Logging
	if (const auto value = lookup("WHOISIT_LOG_LEVEL")) {
		if (!parseLogLevel(std::string(trim(*value)), settings.logging.level)) {
			spdlog::warn("Ignoring WHOISIT_LOG_LEVEL='{}': unknown level", *value);
		}
	}
	readString(lookup, "WHOISIT_LOG_FILE", settings.logging.filePath);

	return settings;
}

Settings loadSettings() {
	return applyEnvironment(Settings{}, [](const std::string& name) -> std::optional<std::string> {
		const char* value = std::getenv(name.c_str());
		if (value == nullptr) {
			return std::nullopt;
		}
		return std::string(value);
	});
}

std::vector<std::string> validate(const Settings& settings) {
	std::vector<std::string> problems;

	const auto& qualifier = settings.qualifier;
	if (!(qualifier.confidenceThreshold > 0.0f && qualifier.confidenceThreshold <= 1.0f)) {
		problems.push_back(std::format("confidence threshold {} must be in (0, 1]", qualifier.confidenceThreshold));
	}
	if (!(qualifier.minFaceAreaFraction >= 0.0 && qualifier.minFaceAreaFraction < 1.0)) {
		problems.push_back(std::format("minimum face area fraction {} must be in [0, 1)", qualifier.minFaceAreaFraction));
	}
	if (qualifier.maxWorkingDimension < 32) {
		problems.push_back(std::format("working dimension {} must be at least 32", qualifier.maxWorkingDimension));
	}

	if (settings.pool.duplicateMaxDistance < 0 || settings.pool.duplicateMaxDistance > 64) {
		problems.push_back(std::format("duplicate distance {} must be in [0, 64]", settings.pool.duplicateMaxDistance));
	}

	const auto& detector = settings.detector;
	if (detector.backend != avatar::DetectorBackend::SkinBlob && detector.modelPath.empty()) {
		problems.push_back("cascade and yunet detectors need a model file");
	}
	if (detector.skin.crMin > detector.skin.crMax || detector.skin.cbMin > detector.skin.cbMax) {
		problems.push_back("skin chroma ranges are empty");
	}

	const auto& game = settings.game;
	if (game.candidateCount < 2u) {
		problems.push_back(std::format("candidate count {} must be at least 2", game.candidateCount));
	}
	if (game.roundExpiry <= std::chrono::seconds::zero()) {
		problems.push_back("round expiry must be positive");
	}
	if (game.sessionIdleTimeout <= std::chrono::seconds::zero()) {
		problems.push_back("session idle timeout must be positive");
	}
	if (trim(game.playCommand).empty()) {
		problems.push_back("play command must not be empty");
	}

	if (settings.logging.maxFileSize == 0u) {
		problems.push_back("log file size limit must be positive");
	}

	return problems;
}

} // namespace whoisit::config
