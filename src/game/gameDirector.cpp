#include "game/gameDirector.hpp"

#include "game/nameMatching.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace whoisit::game {

namespace {

static std::string_view trim(std::string_view text) {
	const auto isSpace = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
	while (!text.empty() && isSpace(text.front())) {
		text.remove_prefix(1u);
	}
	while (!text.empty() && isSpace(text.back())) {
		text.remove_suffix(1u);
	}
	return text;
}

//! Candidate id for a payload: the id itself, or the only candidate whose name matches. Unknown payloads stay as given.
static std::string resolveGuess(const Round& round, std::string_view payload) {
	const std::string guess(trim(payload));
	if (round.findCandidate(guess)) {
		return guess;
	}

	const Candidate* match = nullptr;
	for (const auto& candidate: round.candidates) {
		if (!matchesName(candidate.displayName, guess)) {
			continue;
		}
		if (match) {
			return guess; // Ambiguous
		}
		match = &candidate;
	}
	return match ? match->userId : guess;
}

} // namespace

std::string_view toString(const OutcomeKind kind) {
	switch (kind) {
	case OutcomeKind::RoundStarted:
		return "RoundStarted";
	case OutcomeKind::GuessResolved:
		return "GuessResolved";
	case OutcomeKind::RoundExpired:
		return "RoundExpired";
	case OutcomeKind::NotEnoughPhotos:
		return "NotEnoughPhotos";
	case OutcomeKind::NoActiveRound:
		return "NoActiveRound";
	case OutcomeKind::RoundInProgress:
		return "RoundInProgress";
	case OutcomeKind::UnknownCommand:
		return "UnknownCommand";
	case OutcomeKind::SessionEnded:
		return "SessionEnded";
	case OutcomeKind::SessionAborted:
		return "SessionAborted";
	}
	return "Unknown";
}

GameDirector::GameDirector(SnapshotSource snapshots, GameConfig config, const std::uint64_t seed)
    : m_snapshots(std::move(snapshots)), m_config(std::move(config)), m_seeds(seed) {
}

GameDirector::GameDirector(const avatar::AvatarPool& pool, GameConfig config, const std::uint64_t seed)
    : GameDirector([&pool]() { return pool.qualifiedSnapshot(); }, std::move(config), seed) {
}

SessionSummary GameDirector::getOrCreateSession(const std::string& playerId, const Clock::time_point now) {
	SessionSummary summary{};
	std::unique_lock<std::mutex> lock;
	const auto entry = lockLiveEntry(playerId, now, lock, &summary.created);

	const GameSession& session = entry->session;
	summary.sessionId          = session.sessionId();
	summary.playerId           = session.playerId();
	summary.state              = session.state();
	summary.score              = session.score();
	summary.roundsPlayed       = session.roundsPlayed();
	summary.correctGuesses     = session.correctGuesses();
	return summary;
}

Outcome GameDirector::startRound(const std::string& playerId, const Clock::time_point now) {
	std::unique_lock<std::mutex> lock;
	const auto entry = lockLiveEntry(playerId, now, lock);
	return startLocked(playerId, entry, now);
}

Outcome GameDirector::routeGuess(const std::string& playerId, const std::string& payload, const Clock::time_point now) {
	const auto entry = findEntry(playerId);
	if (!entry) {
		return Outcome{OutcomeKind::NoActiveRound, playerId};
	}
	std::lock_guard<std::mutex> lock(entry->mutex);
	if (entry->session.state() == SessionState::Ended) {
		return Outcome{OutcomeKind::NoActiveRound, playerId}; // Ended and removed meanwhile.
	}
	return guessLocked(playerId, entry, payload, now);
}

Outcome GameDirector::handleMessage(const std::string& playerId, const std::string& text, const Clock::time_point now) {
	const std::string_view message = trim(text);

	if (const auto entry = findEntry(playerId)) {
		std::lock_guard<std::mutex> lock(entry->mutex);
		const GameSession& session = entry->session;

		// An entry ended meanwhile is no longer in the map; handle the message as from a player without a session.
		if (session.state() != SessionState::Ended) {
			const bool awaiting = session.state() == SessionState::AwaitingGuess && session.currentRound();

			if (awaiting && !session.currentRound()->isExpired(now)) {
				return guessLocked(playerId, entry, std::string(message), now);
			}
			if (isPlayCommand(message)) {
				return startLocked(playerId, entry, now);
			}
			if (awaiting) {
				return guessLocked(playerId, entry, std::string(message), now); // Late answer, resolves as expired.
			}
			return Outcome{OutcomeKind::UnknownCommand, playerId};
		}
	}

	if (isPlayCommand(message)) {
		return startRound(playerId, now);
	}
	return Outcome{OutcomeKind::UnknownCommand, playerId};
}

SweepReport GameDirector::sweepIdle(const Clock::time_point now) {
	std::vector<std::pair<std::string, EntryPtr>> entries;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		entries.assign(m_sessions.begin(), m_sessions.end());
	}

	SweepReport report{};
	for (const auto& [playerId, entry]: entries) {
		std::lock_guard<std::mutex> lock(entry->mutex);
		GameSession& session = entry->session;
		try {
			if (auto resolution = session.checkExpiry(now)) {
				report.expiredRounds.push_back(Outcome{OutcomeKind::RoundExpired, playerId, std::nullopt, std::move(resolution)});
			}
			if (session.isIdle(now)) {
				spdlog::info("Session {} of {} idle, removing it (score {})", session.sessionId(), playerId, session.score());
				session.end();
				removeEntry(playerId, entry);
				report.endedPlayers.push_back(playerId);
			}
		} catch (const std::exception& e) {
			abortLocked(playerId, entry, e.what());
			report.endedPlayers.push_back(playerId);
		}
	}
	return report;
}

bool GameDirector::endSession(const std::string& playerId) {
	EntryPtr entry;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_sessions.find(playerId);
		if (it == m_sessions.end()) {
			return false;
		}
		entry = it->second;
		m_sessions.erase(it);
	}

	std::lock_guard<std::mutex> lock(entry->mutex);
	entry->session.end();
	spdlog::info("Session {} of {} ended", entry->session.sessionId(), playerId);
	return true;
}

std::size_t GameDirector::activeSessionCount() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.size();
}

bool GameDirector::hasSession(const std::string& playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.contains(playerId);
}

std::vector<std::string> GameDirector::activePlayers() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	std::vector<std::string> players;
	players.reserve(m_sessions.size());
	for (const auto& [playerId, entry]: m_sessions) {
		players.push_back(playerId);
	}
	return players;
}

GameDirector::EntryPtr GameDirector::findEntry(const std::string& playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_sessions.find(playerId);
	return it == m_sessions.end() ? nullptr : it->second;
}

GameDirector::EntryPtr GameDirector::obtainEntry(const std::string& playerId, const Clock::time_point now, bool* created) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (const auto it = m_sessions.find(playerId); it != m_sessions.end()) {
		if (created) {
			*created = false;
		}
		return it->second;
	}

	const auto sessionId = std::format("session-{}", m_nextSessionNumber++);
	auto entry           = std::make_shared<Entry>(sessionId, playerId, m_config, m_seeds(), now);
	m_sessions.emplace(playerId, entry);
	if (created) {
		*created = true;
	}
	spdlog::debug("Created {} for {}", sessionId, playerId);
	return entry;
}

GameDirector::EntryPtr GameDirector::lockLiveEntry(const std::string& playerId, const Clock::time_point now, std::unique_lock<std::mutex>& lock,
                                                   bool* created) {
	// Ended entries are removed from the map before their lock is released, so each retry sees a newer entry.
	for (;;) {
		auto entry = obtainEntry(playerId, now, created);
		lock       = std::unique_lock<std::mutex>(entry->mutex);
		if (entry->session.state() != SessionState::Ended) {
			return entry;
		}
		lock.unlock();
	}
}

void GameDirector::removeEntry(const std::string& playerId, const EntryPtr& entry) {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_sessions.find(playerId);
	if (it != m_sessions.end() && it->second == entry) {
		m_sessions.erase(it);
	}
}

Outcome GameDirector::startLocked(const std::string& playerId, const EntryPtr& entry, const Clock::time_point now) {
	try {
		const auto pool    = currentPool();
		StartResult result = entry->session.start(*pool, now);

		Outcome outcome{OutcomeKind::RoundStarted, playerId};
		outcome.resolution = std::move(result.expiredRound);
		switch (result.error) {
		case GameError::None:
			outcome.round = std::move(result.round);
			return outcome;
		case GameError::InsufficientPool:
			outcome.kind = OutcomeKind::NotEnoughPhotos;
			return outcome;
		case GameError::RoundInProgress:
			outcome.kind  = OutcomeKind::RoundInProgress;
			outcome.round = entry->session.currentRound();
			return outcome;
		case GameError::NoActiveRound:
			outcome.kind = OutcomeKind::NoActiveRound;
			return outcome;
		case GameError::SessionEnded:
			outcome.kind = OutcomeKind::SessionEnded;
			return outcome;
		case GameError::UnknownSession:
		case GameError::Internal:
			break;
		}
		return abortLocked(playerId, entry, toString(result.error));
	} catch (const std::exception& e) {
		return abortLocked(playerId, entry, e.what());
	}
}

Outcome GameDirector::guessLocked(const std::string& playerId, const EntryPtr& entry, const std::string& payload, const Clock::time_point now) {
	try {
		GameSession& session = entry->session;
		const std::string guess = session.currentRound() ? resolveGuess(*session.currentRound(), payload) : std::string(trim(payload));

		GuessResult result = session.submitGuess(guess, now);
		switch (result.error) {
		case GameError::None:
			if (!result.resolution) {
				break;
			}
			return Outcome{result.resolution->expired ? OutcomeKind::RoundExpired : OutcomeKind::GuessResolved, playerId, std::nullopt,
			               std::move(result.resolution)};
		case GameError::NoActiveRound:
			return Outcome{OutcomeKind::NoActiveRound, playerId};
		case GameError::SessionEnded:
			return Outcome{OutcomeKind::SessionEnded, playerId};
		case GameError::InsufficientPool:
		case GameError::RoundInProgress:
		case GameError::UnknownSession:
		case GameError::Internal:
			break;
		}
		return abortLocked(playerId, entry, toString(result.error));
	} catch (const std::exception& e) {
		return abortLocked(playerId, entry, e.what());
	}
}

Outcome GameDirector::abortLocked(const std::string& playerId, const EntryPtr& entry, const std::string_view what) {
	spdlog::error("Aborting session {} of {}: {}", entry->session.sessionId(), playerId, what);
	entry->session.end();
	removeEntry(playerId, entry);
	return Outcome{OutcomeKind::SessionAborted, playerId};
}

bool GameDirector::isPlayCommand(std::string_view text) const {
	const std::string_view command = trim(m_config.playCommand);
	if (command.empty() || text.size() < command.size()) {
		return false;
	}

	const auto lower = [](const char c) { return std::tolower(static_cast<unsigned char>(c)); };
	if (!std::equal(command.begin(), command.end(), text.begin(), [&lower](const char a, const char b) { return lower(a) == lower(b); })) {
		return false;
	}
	return text.size() == command.size() || std::isspace(static_cast<unsigned char>(text[command.size()])) != 0;
}

avatar::PoolSnapshotPtr GameDirector::currentPool() const {
	static const avatar::PoolSnapshotPtr emptyPool = std::make_shared<const avatar::PoolSnapshot>();

	avatar::PoolSnapshotPtr pool = m_snapshots ? m_snapshots() : nullptr;
	return pool ? pool : emptyPool;
}

} // namespace whoisit::game
