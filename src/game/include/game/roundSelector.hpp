#pragma once

#include "avatar/avatarPool.hpp"
#include "game/round.hpp"

#include <cstddef>
#include <deque>
#include <random>
#include <string>
#include <vector>

namespace whoisit::game {

//! All randomness of the game comes from an injected engine of this type.
using RandomSource = std::mt19937_64;

struct SelectionOptions {
	std::vector<std::string> excludedUserIds{}; //!< Never target or decoy (the player themself).
	bool preferDissimilarNames{true};           //!< Best effort: decoys whose names do not resemble the target's first.
};

struct SelectionResult {
	bool success{false};           //!< False if the eligible pool has fewer than `candidateCount` users.
	Round round{};                 //!< Target and candidates only. The session stamps id and times.
	std::size_t evictedRecent{0u}; //!< Oldest recent targets that had to be dropped to find a target.
};

/*! Pick a target and `candidateCount - 1` decoys from the qualified pool.
 *  The target is drawn uniformly from the eligible users not in `recentTargets`. If all of them are recent, the oldest
 *  recent entries are dropped one at a time until a target is available (reported in `evictedRecent`).
 *  Decoys may be recent targets. Candidate order is shuffled.
 * \param [in]     pool           Qualified snapshot. Never modified.
 * \param [in]     recentTargets  Oldest first.
 * \param [in]     candidateCount Candidates per round (k), target included. Must be at least 1.
 * \param [in,out] rng            Random source. Same seed and inputs give the same round.
 * \param [in]     options        Exclusions and decoy preference.
 */
SelectionResult selectRound(const avatar::PoolSnapshot& pool, const std::deque<std::string>& recentTargets, std::size_t candidateCount,
                            RandomSource& rng, const SelectionOptions& options = SelectionOptions{});

} // namespace whoisit::game
