#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace whoisit::game {

//! Game tuning. By default a round offers 4 candidates and expires after 30 s.
struct GameConfig {
	std::size_t candidateCount{4u};               //!< k: candidates per round, target included.
	std::size_t noRepeatWindow{5u};               //!< W: a target is not asked again within this many rounds.
	std::chrono::seconds roundExpiry{30};         //!< Unanswered rounds resolve as incorrect after this.
	std::chrono::seconds sessionIdleTimeout{600}; //!< Sessions without start/guess activity are reclaimed after this.
	int scoreCorrect{1};
	int scoreIncorrect{0};
	bool preferDissimilarNames{true};  //!< Prefer decoys whose names do not resemble the target's.
	bool excludePlayerFromRounds{true}; //!< Players never see their own avatar.
	std::string playCommand{"play"};   //!< Message prefix that starts a round.
};

} // namespace whoisit::game
