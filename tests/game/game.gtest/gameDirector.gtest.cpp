#include "game/gameDirector.hpp"
#include "game/nameMatching.hpp"

#include "gameTestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace whoisit::game {
namespace gtest {

using namespace std::chrono_literals;

static const Clock::time_point T0{};

static SnapshotSource fixedPool(const int count) {
	const auto snapshot = makeSnapshotPtr(count);
	return [snapshot]() { return snapshot; };
}

static std::string wrongCandidate(const Round& round) {
	for (const auto& candidate: round.candidates) {
		if (candidate.userId != round.targetUserId) {
			return candidate.userId;
		}
	}
	return {};
}

TEST(GameDirectorUnit, StartRound_CreatesSession) {
	GameDirector director(fixedPool(6), GameConfig{}, 1u);
	EXPECT_FALSE(director.hasSession("P1"));

	const auto outcome = director.startRound("P1", T0);
	EXPECT_EQ(outcome.kind, OutcomeKind::RoundStarted);
	EXPECT_EQ(outcome.playerId, "P1");
	ASSERT_TRUE(outcome.round.has_value());
	EXPECT_EQ(outcome.round->candidates.size(), 4u);
	EXPECT_FALSE(outcome.resolution.has_value());

	EXPECT_TRUE(director.hasSession("P1"));
	EXPECT_EQ(director.activeSessionCount(), 1u);
}

TEST(GameDirectorUnit, GetOrCreateSession_OnePerPlayer) {
	GameDirector director(fixedPool(6), GameConfig{}, 1u);
	const auto first  = director.getOrCreateSession("P1", T0);
	const auto second = director.getOrCreateSession("P1", T0);
	const auto other  = director.getOrCreateSession("P2", T0);

	EXPECT_TRUE(first.created);
	EXPECT_FALSE(second.created);
	EXPECT_EQ(first.sessionId, second.sessionId);
	EXPECT_NE(first.sessionId, other.sessionId);
	EXPECT_EQ(first.state, SessionState::Idle);
	EXPECT_EQ(director.activeSessionCount(), 2u);

	auto players = director.activePlayers();
	std::sort(players.begin(), players.end());
	EXPECT_EQ(players, (std::vector<std::string>{"P1", "P2"}));
}

TEST(GameDirectorUnit, GuessById_Resolved) {
	GameDirector director(fixedPool(6), GameConfig{}, 2u);
	const auto round = *director.startRound("P1", T0).round;

	const auto outcome = director.routeGuess("P1", round.targetUserId, T0 + 1s);
	EXPECT_EQ(outcome.kind, OutcomeKind::GuessResolved);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_TRUE(outcome.resolution->correct);
	EXPECT_EQ(director.getOrCreateSession("P1", T0 + 1s).score, 1);
}

TEST(GameDirectorUnit, GuessByName_CaseInsensitive) {
	GameDirector director(fixedPool(6), GameConfig{}, 3u);

	auto round   = *director.startRound("P1", T0).round;
	auto outcome = director.routeGuess("P1", "  " + firstName(round.target()->displayName) + " ", T0);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_TRUE(outcome.resolution->correct);

	round = *director.startRound("P1", T0).round;
	std::string upper = round.target()->displayName;
	std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	outcome = director.routeGuess("P1", upper, T0);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_TRUE(outcome.resolution->correct);
	EXPECT_EQ(outcome.resolution->guessedUserId, round.targetUserId);
}

TEST(GameDirectorUnit, AmbiguousOrUnknownName_Wrong) {
	const auto snapshot = std::make_shared<const avatar::PoolSnapshot>(
	        makeSnapshot({{"U1", "Ann Smith"}, {"U2", "Ann Brown"}, {"U3", "Bob Stone"}, {"U4", "Carl Young"}}));
	GameDirector director([snapshot]() { return snapshot; }, GameConfig{}, 4u);

	director.startRound("P1", T0);
	auto outcome = director.routeGuess("P1", "ann", T0);
	EXPECT_EQ(outcome.kind, OutcomeKind::GuessResolved);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_FALSE(outcome.resolution->correct);

	director.startRound("P1", T0);
	outcome = director.routeGuess("P1", "nobody at all", T0);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_FALSE(outcome.resolution->correct);
	EXPECT_EQ(outcome.resolution->guessedUserId, "nobody at all");
}

TEST(GameDirectorUnit, UniqueSurname_Resolves) {
	const auto snapshot = std::make_shared<const avatar::PoolSnapshot>(
	        makeSnapshot({{"U1", "Ann Smith"}, {"U2", "Ann Brown"}, {"U3", "Bob Stone"}, {"U4", "Carl Young"}}));
	GameDirector director([snapshot]() { return snapshot; }, GameConfig{}, 5u);

	director.startRound("P1", T0);
	const auto outcome = director.routeGuess("P1", "Smith", T0);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_EQ(outcome.resolution->guessedUserId, "U1");
}

TEST(GameDirectorUnit, GuessWithoutRound_NoActiveRound) {
	GameDirector director(fixedPool(6), GameConfig{}, 6u);
	EXPECT_EQ(director.routeGuess("P1", "U10", T0).kind, OutcomeKind::NoActiveRound);
	EXPECT_FALSE(director.hasSession("P1"));

	director.getOrCreateSession("P1", T0);
	EXPECT_EQ(director.routeGuess("P1", "U10", T0).kind, OutcomeKind::NoActiveRound);
}

TEST(GameDirectorUnit, StartTwice_RoundInProgress) {
	GameDirector director(fixedPool(6), GameConfig{}, 7u);
	const auto first  = director.startRound("P1", T0);
	const auto second = director.startRound("P1", T0 + 5s);

	EXPECT_EQ(second.kind, OutcomeKind::RoundInProgress);
	ASSERT_TRUE(second.round.has_value());
	EXPECT_EQ(second.round->roundId, first.round->roundId);
}

TEST(GameDirectorUnit, SmallPool_NotEnoughPhotos) {
	GameDirector director(fixedPool(3), GameConfig{}, 8u);
	const auto outcome = director.startRound("P1", T0);
	EXPECT_EQ(outcome.kind, OutcomeKind::NotEnoughPhotos);
	EXPECT_FALSE(outcome.round.has_value());
	EXPECT_TRUE(director.hasSession("P1"));
}

TEST(GameDirectorUnit, NoSnapshot_NotEnoughPhotos) {
	GameDirector director([]() { return avatar::PoolSnapshotPtr{}; }, GameConfig{}, 9u);
	EXPECT_EQ(director.startRound("P1", T0).kind, OutcomeKind::NotEnoughPhotos);
}

TEST(GameDirectorUnit, FromPool_UsesQualifiedSnapshot) {
	avatar::AvatarPool pool(std::make_shared<const avatar::ImageQualifier>(nullptr));
	GameDirector director(pool, GameConfig{}, 10u);
	EXPECT_EQ(director.startRound("P1", T0).kind, OutcomeKind::NotEnoughPhotos);
}

TEST(GameDirectorUnit, HandleMessage_PlayStartsRound) {
	GameDirector director(fixedPool(6), GameConfig{}, 11u);
	EXPECT_EQ(director.handleMessage("P1", "hello", T0).kind, OutcomeKind::UnknownCommand);
	EXPECT_EQ(director.handleMessage("P1", "player", T0).kind, OutcomeKind::UnknownCommand);
	EXPECT_FALSE(director.hasSession("P1"));

	const auto outcome = director.handleMessage("P1", "  Play please", T0);
	EXPECT_EQ(outcome.kind, OutcomeKind::RoundStarted);
	ASSERT_TRUE(outcome.round.has_value());
}

TEST(GameDirectorUnit, HandleMessage_DuringRoundIsGuess) {
	GameDirector director(fixedPool(6), GameConfig{}, 12u);
	const auto round = *director.handleMessage("P1", "play", T0).round;

	auto outcome = director.handleMessage("P1", round.targetUserId, T0 + 2s);
	EXPECT_EQ(outcome.kind, OutcomeKind::GuessResolved);
	EXPECT_TRUE(outcome.resolution->correct);

	// Resolved: free text is no guess anymore.
	EXPECT_EQ(director.handleMessage("P1", "who?", T0 + 3s).kind, OutcomeKind::UnknownCommand);

	director.handleMessage("P1", "play", T0 + 4s);
	outcome = director.handleMessage("P1", "play", T0 + 5s);
	EXPECT_EQ(outcome.kind, OutcomeKind::GuessResolved);
	EXPECT_FALSE(outcome.resolution->correct);
}

TEST(GameDirectorUnit, HandleMessage_PlayAfterExpiry) {
	GameDirector director(fixedPool(6), GameConfig{}, 13u);
	const auto first = *director.handleMessage("P1", "play", T0).round;

	const auto outcome = director.handleMessage("P1", "play", T0 + 40s);
	EXPECT_EQ(outcome.kind, OutcomeKind::RoundStarted);
	ASSERT_TRUE(outcome.resolution.has_value());
	EXPECT_TRUE(outcome.resolution->expired);
	EXPECT_EQ(outcome.resolution->roundId, first.roundId);
	ASSERT_TRUE(outcome.round.has_value());
}

TEST(GameDirectorUnit, HandleMessage_LateAnswerExpires) {
	GameDirector director(fixedPool(6), GameConfig{}, 14u);
	const auto round = *director.handleMessage("P1", "play", T0).round;

	const auto outcome = director.handleMessage("P1", round.targetUserId, T0 + 40s);
	EXPECT_EQ(outcome.kind, OutcomeKind::RoundExpired);
	EXPECT_FALSE(outcome.resolution->correct);
}

TEST(GameDirectorUnit, CustomPlayCommand) {
	GameConfig config{};
	config.playCommand = "guesswho";
	GameDirector director(fixedPool(6), config, 15u);
	EXPECT_EQ(director.handleMessage("P1", "play", T0).kind, OutcomeKind::UnknownCommand);
	EXPECT_EQ(director.handleMessage("P1", "GuessWho", T0).kind, OutcomeKind::RoundStarted);
}

TEST(GameDirectorUnit, Sweep_ResolvesExpiredRounds) {
	GameDirector director(fixedPool(6), GameConfig{}, 16u);
	const auto round = *director.startRound("P1", T0).round;
	director.startRound("P2", T0 + 20s);

	auto report = director.sweepIdle(T0 + 30s);
	ASSERT_EQ(report.expiredRounds.size(), 1u);
	EXPECT_EQ(report.expiredRounds[0].kind, OutcomeKind::RoundExpired);
	EXPECT_EQ(report.expiredRounds[0].playerId, "P1");
	EXPECT_EQ(report.expiredRounds[0].resolution->targetUserId, round.targetUserId);
	EXPECT_FALSE(report.expiredRounds[0].resolution->correct);
	EXPECT_TRUE(report.endedPlayers.empty());

	// Expired round does not block the next one.
	EXPECT_EQ(director.startRound("P1", T0 + 31s).kind, OutcomeKind::RoundStarted);

	report = director.sweepIdle(T0 + 31s);
	EXPECT_TRUE(report.expiredRounds.empty());
}

TEST(GameDirectorUnit, Sweep_RemovesIdleSessions) {
	GameDirector director(fixedPool(6), GameConfig{}, 17u);
	director.startRound("P1", T0);
	director.startRound("P2", T0 + 500s);

	const auto report = director.sweepIdle(T0 + 601s);
	EXPECT_EQ(report.endedPlayers, (std::vector<std::string>{"P1"}));
	EXPECT_FALSE(director.hasSession("P1"));
	EXPECT_TRUE(director.hasSession("P2"));
	EXPECT_EQ(director.activeSessionCount(), 1u);

	// A later message starts from scratch.
	EXPECT_TRUE(director.getOrCreateSession("P1", T0 + 602s).created);
}

TEST(GameDirectorUnit, EndSession) {
	GameDirector director(fixedPool(6), GameConfig{}, 18u);
	director.startRound("P1", T0);
	EXPECT_TRUE(director.endSession("P1"));
	EXPECT_FALSE(director.endSession("P1"));
	EXPECT_FALSE(director.hasSession("P1"));
	EXPECT_EQ(director.routeGuess("P1", "U10", T0).kind, OutcomeKind::NoActiveRound);
}

TEST(GameDirectorUnit, FailingSession_AbortedOthersUnaffected) {
	const auto snapshot = makeSnapshotPtr(6);
	std::atomic<bool> failing{false};
	GameDirector director(
	        [&]() {
		        if (failing.load()) {
			        throw std::runtime_error("pool storage corrupted");
		        }
		        return snapshot;
	        },
	        GameConfig{}, 19u);

	const auto round = *director.startRound("P1", T0).round;
	failing          = true;

	EXPECT_EQ(director.startRound("P2", T0).kind, OutcomeKind::SessionAborted);
	EXPECT_FALSE(director.hasSession("P2"));

	const auto outcome = director.routeGuess("P1", round.targetUserId, T0 + 1s);
	EXPECT_EQ(outcome.kind, OutcomeKind::GuessResolved);
	EXPECT_TRUE(outcome.resolution->correct);
}

TEST(GameDirectorUnit, SameSeed_SameRounds) {
	GameDirector a(fixedPool(10), GameConfig{}, 20u);
	GameDirector b(fixedPool(10), GameConfig{}, 20u);

	for (int i = 0; i < 5; ++i) {
		const auto ra = *a.startRound("P1", T0).round;
		const auto rb = *b.startRound("P1", T0).round;
		EXPECT_EQ(ra.targetUserId, rb.targetUserId);
		a.routeGuess("P1", wrongCandidate(ra), T0);
		b.routeGuess("P1", wrongCandidate(rb), T0);
	}
}

TEST(GameDirectorConcurrency, ManyPlayers_Independent) {
	GameDirector director(fixedPool(12), GameConfig{}, 21u);
	std::atomic<int> correct{0};

	std::vector<std::thread> threads;
	for (int p = 0; p < 8; ++p) {
		threads.emplace_back([&director, &correct, p]() {
			const std::string player = "P" + std::to_string(p);
			for (int i = 0; i < 20; ++i) {
				const auto started = director.startRound(player);
				if (!started.round) {
					continue;
				}
				const auto outcome = director.routeGuess(player, started.round->targetUserId);
				if (outcome.resolution && outcome.resolution->correct) {
					++correct;
				}
			}
		});
	}
	for (auto& thread: threads) {
		thread.join();
	}

	EXPECT_EQ(correct.load(), 8 * 20);
	EXPECT_EQ(director.activeSessionCount(), 8u);
	for (int p = 0; p < 8; ++p) {
		EXPECT_EQ(director.getOrCreateSession("P" + std::to_string(p)).score, 20);
	}
}

TEST(GameDirectorConcurrency, PlayWhileEnding_NeverSessionEnded) {
	// A session ended by another thread is replaced, so "play" never reports a session the map no longer holds.
	GameDirector director(fixedPool(6), GameConfig{}, 5u);
	std::atomic<bool> running{true};
	std::atomic<int> endedOutcomes{0};
	std::atomic<int> started{0};

	std::thread ender([&director, &running]() {
		while (running) {
			director.endSession("P1");
		}
	});

	for (int i = 0; i < 2000; ++i) {
		const auto outcome = i % 2 == 0 ? director.startRound("P1", T0) : director.handleMessage("P1", "play", T0);
		if (outcome.kind == OutcomeKind::SessionEnded) {
			++endedOutcomes;
		}
		if (outcome.kind == OutcomeKind::RoundStarted) {
			++started;
		}
		EXPECT_NE(outcome.kind, OutcomeKind::SessionAborted);
		EXPECT_NE(director.getOrCreateSession("P1", T0).state, SessionState::Ended);
	}
	running = false;
	ender.join();

	EXPECT_EQ(endedOutcomes.load(), 0);
	EXPECT_GT(started.load(), 0);
}

TEST(GameDirectorUnit, EndedSession_PlayStartsFresh) {
	GameDirector director(fixedPool(6), GameConfig{}, 5u);
	director.startRound("P1", T0);
	ASSERT_TRUE(director.endSession("P1"));

	EXPECT_EQ(director.handleMessage("P1", "play", T0).kind, OutcomeKind::RoundStarted);
	EXPECT_EQ(director.getOrCreateSession("P1", T0).roundsPlayed, 0u);
}

TEST(GameDirectorUnit, OutcomeToString) {
	EXPECT_EQ(toString(OutcomeKind::NotEnoughPhotos), "NotEnoughPhotos");
	EXPECT_EQ(toString(OutcomeKind::SessionAborted), "SessionAborted");
}

} // namespace gtest
} // namespace whoisit::game
