#include "game/nameMatching.hpp"
#include "game/roundSelector.hpp"

#include "gameTestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <string>

namespace whoisit::game {
namespace gtest {

static std::set<std::string> candidateIds(const Round& round) {
	std::set<std::string> ids;
	for (const auto& candidate: round.candidates) {
		ids.insert(candidate.userId);
	}
	return ids;
}

TEST(RoundSelectorUnit, EnoughUsers_KDistinctCandidatesWithTarget) {
	const auto pool = makeSnapshot(10);
	for (std::uint64_t seed = 0u; seed < 20u; ++seed) {
		RandomSource rng(seed);
		const auto result = selectRound(pool, {}, 4u, rng);

		ASSERT_TRUE(result.success);
		EXPECT_TRUE(isValidRound(result.round));
		EXPECT_EQ(result.round.candidates.size(), 4u);
		EXPECT_EQ(candidateIds(result.round).size(), 4u);
		EXPECT_EQ(std::count_if(result.round.candidates.begin(), result.round.candidates.end(),
		                        [&result](const Candidate& c) { return c.userId == result.round.targetUserId; }),
		          1);
		EXPECT_EQ(result.evictedRecent, 0u);
	}
}

TEST(RoundSelectorUnit, PoolExactlyK_Succeeds) {
	RandomSource rng(1u);
	const auto result = selectRound(makeSnapshot(4), {}, 4u, rng);
	ASSERT_TRUE(result.success);
	EXPECT_EQ(candidateIds(result.round).size(), 4u);
}

TEST(RoundSelectorUnit, PoolSmallerThanK_Fails) {
	RandomSource rng(1u);
	EXPECT_FALSE(selectRound(makeSnapshot(3), {}, 4u, rng).success);
	EXPECT_FALSE(selectRound(makeSnapshot(0), {}, 4u, rng).success);
	EXPECT_FALSE(selectRound(makeSnapshot(5), {}, 0u, rng).success);
}

TEST(RoundSelectorUnit, UnqualifiedRecords_NotEligible) {
	auto pool              = makeSnapshot(4);
	pool.records[0].status = avatar::QualificationStatus::Rejected;
	pool.records[1].status = avatar::QualificationStatus::Unchecked;

	RandomSource rng(3u);
	EXPECT_FALSE(selectRound(pool, {}, 3u, rng).success);

	const auto result = selectRound(pool, {}, 2u, rng);
	ASSERT_TRUE(result.success);
	EXPECT_EQ(candidateIds(result.round), (std::set<std::string>{"U12", "U13"}));
}

TEST(RoundSelectorUnit, ExcludedUser_NeverCandidate) {
	const auto pool = makeSnapshot(5);
	SelectionOptions options{};
	options.excludedUserIds = {"U10"};

	for (std::uint64_t seed = 0u; seed < 30u; ++seed) {
		RandomSource rng(seed);
		const auto result = selectRound(pool, {}, 4u, rng, options);
		ASSERT_TRUE(result.success);
		EXPECT_FALSE(candidateIds(result.round).contains("U10"));
	}

	RandomSource rng(0u);
	EXPECT_FALSE(selectRound(pool, {}, 5u, rng, options).success);
}

TEST(RoundSelectorUnit, SameSeed_SameRound) {
	const auto pool = makeSnapshot(12);
	const std::deque<std::string> recent{"U11", "U14"};

	RandomSource a(42u);
	RandomSource b(42u);
	const auto first  = selectRound(pool, recent, 4u, a);
	const auto second = selectRound(pool, recent, 4u, b);

	ASSERT_TRUE(first.success);
	ASSERT_TRUE(second.success);
	EXPECT_EQ(first.round.targetUserId, second.round.targetUserId);
	ASSERT_EQ(first.round.candidates.size(), second.round.candidates.size());
	for (std::size_t i = 0; i < first.round.candidates.size(); ++i) {
		EXPECT_EQ(first.round.candidates[i].userId, second.round.candidates[i].userId);
	}
}

TEST(RoundSelectorUnit, RecentTargets_NotPickedAgainWithinWindow) {
	constexpr std::size_t WINDOW = 5u;
	const auto pool              = makeSnapshot(8);

	for (std::uint64_t seed = 0u; seed < 10u; ++seed) {
		RandomSource rng(seed);
		RecentTargets recent(WINDOW);
		std::deque<std::string> history;

		for (int round = 0; round < 30; ++round) {
			const auto result = selectRound(pool, recent.entries(), 4u, rng);
			ASSERT_TRUE(result.success);
			EXPECT_EQ(result.evictedRecent, 0u);
			EXPECT_FALSE(recent.contains(result.round.targetUserId));

			// Also check against the raw history of the last W targets.
			const auto windowStart = history.size() > WINDOW ? history.end() - WINDOW : history.begin();
			EXPECT_EQ(std::find(windowStart, history.end(), result.round.targetUserId), history.end());

			recent.push(result.round.targetUserId);
			history.push_back(result.round.targetUserId);
		}
	}
}

TEST(RoundSelectorUnit, WindowCoversPool_OldestRecentEvicted) {
	const auto pool = makeSnapshot(4);
	const std::deque<std::string> recent{"U12", "U10", "U11", "U13"}; // Everyone, oldest first.

	RandomSource rng(5u);
	const auto result = selectRound(pool, recent, 4u, rng);
	ASSERT_TRUE(result.success);
	EXPECT_EQ(result.evictedRecent, 1u);
	EXPECT_EQ(result.round.targetUserId, "U12");
}

TEST(RoundSelectorUnit, TargetPosition_Varies) {
	const auto pool = makeSnapshot(10);
	std::map<std::size_t, int> positions;

	RandomSource rng(9u);
	for (int i = 0; i < 200; ++i) {
		const auto result = selectRound(pool, {}, 4u, rng);
		ASSERT_TRUE(result.success);
		for (std::size_t p = 0; p < result.round.candidates.size(); ++p) {
			if (result.round.candidates[p].userId == result.round.targetUserId) {
				++positions[p];
			}
		}
	}
	EXPECT_EQ(positions.size(), 4u);
}

TEST(RoundSelectorUnit, DissimilarNames_PreferredAsDecoys) {
	// Target "Ann Smith" can only be told apart from the "A" names by the face, so avoid them when possible.
	const auto pool = makeSnapshot({{"U1", "Ann Smith"},
	                                {"U2", "Anna Jones"},
	                                {"U3", "Ann Brown"},
	                                {"U4", "Bob Stone"},
	                                {"U5", "Carl Young"},
	                                {"U6", "Dora Quinn"}});

	SelectionOptions options{};
	for (std::uint64_t seed = 0u; seed < 40u; ++seed) {
		RandomSource rng(seed);
		const auto result = selectRound(pool, {"U2", "U3", "U4", "U5", "U6"}, 4u, rng, options);
		ASSERT_TRUE(result.success);
		ASSERT_EQ(result.round.targetUserId, "U1");

		const auto ids = candidateIds(result.round);
		EXPECT_TRUE(ids.contains("U4"));
		EXPECT_TRUE(ids.contains("U5"));
		EXPECT_TRUE(ids.contains("U6"));
	}
}

TEST(RoundSelectorUnit, CandidatesCarryPoolData) {
	const auto pool = makeSnapshot(4);
	RandomSource rng(2u);
	const auto result = selectRound(pool, {}, 4u, rng);
	ASSERT_TRUE(result.success);

	for (const auto& candidate: result.round.candidates) {
		const auto record = std::find_if(pool.records.begin(), pool.records.end(), [&candidate](const auto& r) { return r.userId == candidate.userId; });
		ASSERT_NE(record, pool.records.end());
		EXPECT_EQ(candidate.displayName, record->displayName);
		EXPECT_EQ(candidate.imageReference, record->imageReference);
	}
}

TEST(RecentTargetsUnit, BoundedOldestEvicted) {
	RecentTargets recent(2u);
	recent.push("A");
	recent.push("B");
	recent.push("C");
	EXPECT_EQ(recent.size(), 2u);
	EXPECT_FALSE(recent.contains("A"));
	EXPECT_EQ(recent.entries().front(), "B");

	recent.dropOldest(1u);
	EXPECT_EQ(recent.entries().front(), "C");
	recent.dropOldest(5u);
	EXPECT_EQ(recent.size(), 0u);
}

TEST(RecentTargetsUnit, ZeroCapacity_NeverRemembers) {
	RecentTargets recent(0u);
	recent.push("A");
	EXPECT_EQ(recent.size(), 0u);
	EXPECT_FALSE(recent.contains("A"));
}

TEST(RoundUnit, Validity) {
	Round round{};
	EXPECT_FALSE(isValidRound(round));

	round.targetUserId = "U1";
	round.candidates   = {{"U1", "A", ""}, {"U2", "B", ""}};
	EXPECT_TRUE(isValidRound(round));
	ASSERT_NE(round.target(), nullptr);
	EXPECT_EQ(round.target()->displayName, "A");
	EXPECT_EQ(round.findCandidate("U3"), nullptr);

	round.candidates.push_back({"U2", "B", ""});
	EXPECT_FALSE(isValidRound(round));

	round.candidates = {{"U2", "B", ""}, {"U3", "C", ""}};
	EXPECT_FALSE(isValidRound(round));
}

} // namespace gtest
} // namespace whoisit::game
