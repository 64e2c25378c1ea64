#pragma once

#include "avatar/avatarPool.hpp"
#include "game/gameConfig.hpp"
#include "game/gameSession.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace whoisit::game {

enum class OutcomeKind {
	RoundStarted,    //!< `round` holds the new question.
	GuessResolved,   //!< `resolution` holds the answer.
	RoundExpired,    //!< `resolution` holds the timed out round.
	NotEnoughPhotos, //!< Fewer qualified avatars than candidates per round.
	NoActiveRound,   //!< Guess without a question. Nothing changed.
	RoundInProgress, //!< Start while a question is open. `round` repeats it.
	UnknownCommand,  //!< Message that is neither a guess nor the play command.
	SessionEnded,
	SessionAborted, //!< The session failed internally and was removed.
};

std::string_view toString(OutcomeKind kind);

//! Result of one director call, ready to be rendered by the chat client.
struct Outcome {
	OutcomeKind kind;
	std::string playerId;
	std::optional<Round> round{};           //!< Prompt to show.
	std::optional<Resolution> resolution{}; //!< Also set on RoundStarted/NotEnoughPhotos if a previous round expired first.
};

struct SessionSummary {
	std::string sessionId;
	std::string playerId;
	SessionState state{SessionState::Idle};
	int score{0};
	unsigned roundsPlayed{0u};
	unsigned correctGuesses{0u};
	bool created{false}; //!< The call created the session.
};

struct SweepReport {
	std::vector<Outcome> expiredRounds;     //!< RoundExpired outcomes of rounds nobody answered in time.
	std::vector<std::string> endedPlayers;  //!< Players whose idle session was removed.
};

//! Returns the current qualified pool. May return null for an empty pool.
using SnapshotSource = std::function<avatar::PoolSnapshotPtr()>;

/*! Routes chat events to per-player game sessions.
 *  Thread-safe. At most one session exists per player; calls for one player are serialized by that
 *  session's mutex while different players proceed in parallel. No exception leaves the director: a
 *  failing session is logged, aborted and removed without affecting the others.
 *  Scheduling is external: the owner calls sweepIdle() from its own timer.
 */
class GameDirector {
public:
	GameDirector(SnapshotSource snapshots, GameConfig config = GameConfig{}, std::uint64_t seed = std::random_device{}());
	GameDirector(const avatar::AvatarPool& pool, GameConfig config = GameConfig{}, std::uint64_t seed = std::random_device{}());

	SessionSummary getOrCreateSession(const std::string& playerId, Clock::time_point now = Clock::now());

	//! Ask the player a new question, creating the session if needed.
	Outcome startRound(const std::string& playerId, Clock::time_point now = Clock::now());

	/*! Answer the open question.
	 * \param [in] payload Candidate user id, or a name matching exactly one candidate (any name part, ignoring case).
	 *                     Anything else counts as a wrong answer.
	 */
	Outcome routeGuess(const std::string& playerId, const std::string& payload, Clock::time_point now = Clock::now());

	/*! Free text chat entry point.
	 *  Open question -> guess. Message starting with the play command -> new question. Otherwise UnknownCommand.
	 */
	Outcome handleMessage(const std::string& playerId, const std::string& text, Clock::time_point now = Clock::now());

	//! Resolve expired rounds and remove sessions idle for longer than the idle timeout.
	SweepReport sweepIdle(Clock::time_point now = Clock::now());

	//! \returns False if the player had no session.
	bool endSession(const std::string& playerId);

	std::size_t activeSessionCount() const;
	bool hasSession(const std::string& playerId) const;
	std::vector<std::string> activePlayers() const;

	const GameConfig& config() const {
		return m_config;
	}

private:
	struct Entry {
		Entry(std::string sessionId, std::string playerId, const GameConfig& config, std::uint64_t seed, Clock::time_point now)
		    : session(std::move(sessionId), std::move(playerId), config, seed, now) {
		}

		std::mutex mutex; //!< Serializes all calls for this session.
		GameSession session;
	};
	using EntryPtr = std::shared_ptr<Entry>;

	EntryPtr findEntry(const std::string& playerId) const;
	EntryPtr obtainEntry(const std::string& playerId, Clock::time_point now, bool* created = nullptr);
	void removeEntry(const std::string& playerId, const EntryPtr& entry);
	//! Obtain and lock the player's entry. Entries ended and removed between lookup and locking are replaced by fresh ones.
	EntryPtr lockLiveEntry(const std::string& playerId, Clock::time_point now, std::unique_lock<std::mutex>& lock, bool* created = nullptr);

	// Require the entry mutex.
	Outcome startLocked(const std::string& playerId, const EntryPtr& entry, Clock::time_point now);
	Outcome guessLocked(const std::string& playerId, const EntryPtr& entry, const std::string& payload, Clock::time_point now);
	Outcome abortLocked(const std::string& playerId, const EntryPtr& entry, std::string_view what);

	bool isPlayCommand(std::string_view text) const;
	avatar::PoolSnapshotPtr currentPool() const;

private:
	SnapshotSource m_snapshots;
	GameConfig m_config;

	mutable std::mutex m_mutex; //!< Guards the session map and the seed source.
	std::map<std::string, EntryPtr> m_sessions;
	RandomSource m_seeds;
	std::uint64_t m_nextSessionNumber{1u};
};

} // namespace whoisit::game
