#include "game/gameSession.hpp"

#include "game/nameMatching.hpp"

#include <spdlog/spdlog.h>

namespace whoisit::game {

std::string_view toString(const SessionState state) {
	switch (state) {
	case SessionState::Idle:
		return "Idle";
	case SessionState::AwaitingGuess:
		return "AwaitingGuess";
	case SessionState::Resolved:
		return "Resolved";
	case SessionState::Ended:
		return "Ended";
	}
	return "Unknown";
}

std::string_view toString(const GameError error) {
	switch (error) {
	case GameError::None:
		return "None";
	case GameError::InsufficientPool:
		return "InsufficientPool";
	case GameError::RoundInProgress:
		return "RoundInProgress";
	case GameError::NoActiveRound:
		return "NoActiveRound";
	case GameError::SessionEnded:
		return "SessionEnded";
	case GameError::UnknownSession:
		return "UnknownSession";
	case GameError::Internal:
		return "Internal";
	}
	return "Unknown";
}

GameSession::GameSession(std::string sessionId, std::string playerId, GameConfig config, const std::uint64_t seed, const Clock::time_point now)
    : m_sessionId(std::move(sessionId)), m_playerId(std::move(playerId)), m_config(std::move(config)), m_rng(seed),
      m_recentTargets(m_config.noRepeatWindow), m_lastActivity(now) {
}

StartResult GameSession::start(const avatar::PoolSnapshot& pool, const Clock::time_point now) {
	StartResult result{};
	if (m_state == SessionState::Ended) {
		result.error = GameError::SessionEnded;
		return result;
	}
	m_lastActivity = now;

	if (m_state == SessionState::AwaitingGuess) {
		result.expiredRound = checkExpiry(now);
		if (!result.expiredRound) {
			result.error = GameError::RoundInProgress;
			return result;
		}
	}

	SelectionOptions options{};
	options.preferDissimilarNames = m_config.preferDissimilarNames;
	if (m_config.excludePlayerFromRounds) {
		options.excludedUserIds.push_back(m_playerId);
	}

	SelectionResult selection = selectRound(pool, m_recentTargets.entries(), m_config.candidateCount, m_rng, options);
	if (!selection.success) {
		spdlog::info("Session {}: not enough qualified avatars for a round ({} in pool, {} needed)", m_sessionId, pool.records.size(),
		             m_config.candidateCount);
		result.error = GameError::InsufficientPool;
		return result;
	}

	Round round = std::move(selection.round);
	if (!isValidRound(round) || m_recentTargets.entries().size() < selection.evictedRecent) {
		spdlog::error("Session {}: selector produced an invalid round, aborting session", m_sessionId);
		end();
		result.error = GameError::Internal;
		return result;
	}

	m_recentTargets.dropOldest(selection.evictedRecent);
	round.roundId   = m_nextRoundId++;
	round.createdAt = now;
	round.expiresAt = now + m_config.roundExpiry;

	m_round = round;
	m_state = SessionState::AwaitingGuess;
	spdlog::info("Session {}: round {} started with {} candidates", m_sessionId, round.roundId, round.candidates.size());

	result.round = std::move(round);
	return result;
}

GuessResult GameSession::submitGuess(const std::string& guessedUserId, const Clock::time_point now) {
	GuessResult result{};
	if (m_state == SessionState::Ended) {
		result.error = GameError::SessionEnded;
		return result;
	}
	if (m_state != SessionState::AwaitingGuess || !m_round) {
		result.error = GameError::NoActiveRound;
		return result;
	}

	m_lastActivity     = now;
	const bool expired = m_round->isExpired(now);
	result.resolution  = resolve(guessedUserId, expired);
	return result;
}

std::optional<Resolution> GameSession::checkExpiry(const Clock::time_point now) {
	if (m_state != SessionState::AwaitingGuess || !m_round || !m_round->isExpired(now)) {
		return std::nullopt;
	}
	return resolve({}, true);
}

void GameSession::end() {
	if (m_state == SessionState::Ended) {
		return;
	}
	m_state = SessionState::Ended;
	m_round.reset();
	spdlog::debug("Session {} ended (score {}, {} rounds)", m_sessionId, m_score, m_roundsPlayed);
}

bool GameSession::isIdle(const Clock::time_point now) const {
	return m_state != SessionState::Ended && now - m_lastActivity >= m_config.sessionIdleTimeout;
}

Resolution GameSession::resolve(std::string guessedUserId, const bool expired) {
	const Round& round         = *m_round;
	const Candidate* target    = round.target();
	const std::string& display = target ? target->displayName : round.targetUserId;

	Resolution resolution{};
	resolution.roundId           = round.roundId;
	resolution.expired           = expired;
	resolution.correct           = !expired && guessedUserId == round.targetUserId;
	resolution.guessedUserId     = std::move(guessedUserId);
	resolution.targetUserId      = round.targetUserId;
	resolution.targetDisplayName = display;
	resolution.targetFirstName   = firstName(display);
	resolution.scoreDelta        = resolution.correct ? m_config.scoreCorrect : m_config.scoreIncorrect;

	m_score += resolution.scoreDelta;
	++m_roundsPlayed;
	if (resolution.correct) {
		++m_correctGuesses;
	}
	resolution.totalScore = m_score;

	m_recentTargets.push(round.targetUserId);
	m_round.reset();
	m_state          = SessionState::Resolved;
	m_lastResolution = resolution;

	if (expired) {
		spdlog::info("Session {}: round {} expired, it was {}", m_sessionId, resolution.roundId, resolution.targetUserId);
	} else {
		spdlog::info("Session {}: {} guessed {} for round {} ({})", m_sessionId, m_playerId, resolution.guessedUserId, resolution.roundId,
		             resolution.correct ? "correct" : "incorrect");
	}
	return resolution;
}

} // namespace whoisit::game
