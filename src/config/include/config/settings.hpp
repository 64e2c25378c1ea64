#pragma once

#include "avatar/avatarPool.hpp"
#include "avatar/faceDetector.hpp"
#include "avatar/imageQualifier.hpp"
#include "common/logging.hpp"
#include "game/gameConfig.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace whoisit::config {

//! Complete runtime configuration. Every member carries its documented default.
struct Settings {
	avatar::DetectorConfig detector{};
	avatar::QualifierConfig qualifier{};
	avatar::PoolConfig pool{};
	game::GameConfig game{};
	LoggingConfig logging{};
};

//! Variable name -> value, nullopt if unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

/*! Apply WHOISIT_* overrides on top of `base`.
 *  Recognized: WHOISIT_CONFIDENCE_THRESHOLD, WHOISIT_MIN_FACE_AREA_FRACTION, WHOISIT_CANDIDATE_COUNT,
 *  WHOISIT_NO_REPEAT_WINDOW, WHOISIT_ROUND_EXPIRY_SECONDS, WHOISIT_SESSION_IDLE_TIMEOUT_SECONDS,
 *  WHOISIT_DUPLICATE_MAX_DISTANCE, WHOISIT_DETECTOR, WHOISIT_DETECTOR_MODEL, WHOISIT_LOG_LEVEL,
 *  WHOISIT_LOG_FILE, WHOISIT_PLAY_COMMAND.
 *  Values that do not parse are logged and leave the base value in place.
 */
Settings applyEnvironment(const Settings& base, const EnvironmentLookup& lookup);

//! Defaults overridden by the process environment.
Settings loadSettings();

//! Violated constraints in readable form. Empty if the settings are usable.
std::vector<std::string> validate(const Settings& settings);

} // namespace whoisit::config
