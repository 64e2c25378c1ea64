#pragma once

#include "avatar/avatarPool.hpp"
#include "game/gameConfig.hpp"
#include "game/round.hpp"
#include "game/roundSelector.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace whoisit::game {

//! Idle -> AwaitingGuess -> Resolved -> (start) AwaitingGuess ... ; any -> Ended.
enum class SessionState { Idle, AwaitingGuess, Resolved, Ended };

enum class GameError {
	None,
	InsufficientPool, //!< Not enough qualified avatars for a round.
	RoundInProgress,  //!< start() while an unexpired round waits for a guess.
	NoActiveRound,    //!< Guess without a round waiting for one.
	SessionEnded,
	UnknownSession,
	Internal, //!< Broken invariant. The affected session is aborted.
};

std::string_view toString(SessionState state);
std::string_view toString(GameError error);

//! Outcome of a round. The target is always revealed.
struct Resolution {
	std::uint64_t roundId{0u};
	bool correct{false};
	bool expired{false};         //!< Resolved by timeout (possibly on a late guess).
	std::string guessedUserId{}; //!< Empty if no guess arrived.
	std::string targetUserId;
	std::string targetDisplayName;
	std::string targetFirstName;
	int scoreDelta{0};
	int totalScore{0};
};

struct StartResult {
	GameError error{GameError::None};
	Round round{};                                //!< Valid if error == None.
	std::optional<Resolution> expiredRound{};     //!< Previous round that timed out and was resolved first.
};

struct GuessResult {
	GameError error{GameError::None};
	std::optional<Resolution> resolution{};
};

/*! State machine of one player's game.
 *  Not thread-safe: the owner (GameDirector) serializes all calls for one session.
 *  Time is passed in, so expiry and idle behaviour are testable without a clock.
 */
class GameSession {
public:
	GameSession(std::string sessionId, std::string playerId, GameConfig config, std::uint64_t seed, Clock::time_point now = Clock::now());

	//! Ask a new question. Resolves an expired round first.
	StartResult start(const avatar::PoolSnapshot& pool, Clock::time_point now = Clock::now());

	//! Answer the current question with a candidate's user id. A guess after expiry resolves the round as expired.
	GuessResult submitGuess(const std::string& guessedUserId, Clock::time_point now = Clock::now());

	//! Resolve the current round as incorrect if it has expired. Does not count as player activity.
	std::optional<Resolution> checkExpiry(Clock::time_point now);

	void end(); //!< Irreversible.

	//! No start/guess activity for longer than the idle timeout, and not yet ended.
	bool isIdle(Clock::time_point now) const;

	const std::string& sessionId() const {
		return m_sessionId;
	}
	const std::string& playerId() const {
		return m_playerId;
	}
	SessionState state() const {
		return m_state;
	}
	int score() const {
		return m_score;
	}
	unsigned roundsPlayed() const {
		return m_roundsPlayed;
	}
	unsigned correctGuesses() const {
		return m_correctGuesses;
	}
	const std::optional<Round>& currentRound() const {
		return m_round;
	}
	const std::optional<Resolution>& lastResolution() const {
		return m_lastResolution;
	}
	const RecentTargets& recentTargets() const {
		return m_recentTargets;
	}
	Clock::time_point lastActivity() const {
		return m_lastActivity;
	}

private:
	Resolution resolve(std::string guessedUserId, bool expired);

private:
	std::string m_sessionId;
	std::string m_playerId;
	GameConfig m_config;
	RandomSource m_rng;

	SessionState m_state{SessionState::Idle};
	std::optional<Round> m_round{};
	std::optional<Resolution> m_lastResolution{};
	RecentTargets m_recentTargets;
	std::uint64_t m_nextRoundId{1u};

	int m_score{0};
	unsigned m_roundsPlayed{0u};
	unsigned m_correctGuesses{0u};
	Clock::time_point m_lastActivity;
};

} // namespace whoisit::game
