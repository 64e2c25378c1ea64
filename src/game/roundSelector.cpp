#include "game/roundSelector.hpp"

#include "game/nameMatching.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace whoisit::game {

namespace {

static Candidate toCandidate(const avatar::AvatarRecord& record) {
	return Candidate{record.userId, record.displayName, record.imageReference};
}

//! Qualified records that may appear in a round, in snapshot order (sorted by user id).
static std::vector<const avatar::AvatarRecord*> eligibleRecords(const avatar::PoolSnapshot& pool, const SelectionOptions& options) {
	const std::set<std::string> excluded(options.excludedUserIds.begin(), options.excludedUserIds.end());

	std::vector<const avatar::AvatarRecord*> eligible;
	std::set<std::string> seen;
	for (const auto& record: pool.records) {
		if (record.status != avatar::QualificationStatus::Qualified || record.userId.empty() || excluded.contains(record.userId)) {
			continue;
		}
		if (seen.insert(record.userId).second) {
			eligible.push_back(&record);
		}
	}
	return eligible;
}

} // namespace

SelectionResult selectRound(const avatar::PoolSnapshot& pool, const std::deque<std::string>& recentTargets, const std::size_t candidateCount,
                            RandomSource& rng, const SelectionOptions& options) {
	SelectionResult result{};

	const auto eligible = eligibleRecords(pool, options);
	if (candidateCount == 0u || eligible.size() < candidateCount) {
		return result;
	}

	// Target: widen the no-repeat window oldest first until someone is available.
	const avatar::AvatarRecord* target = nullptr;
	for (std::size_t evicted = 0u; evicted <= recentTargets.size() && target == nullptr; ++evicted) {
		const std::set<std::string> blocked(recentTargets.begin() + static_cast<std::ptrdiff_t>(evicted), recentTargets.end());

		std::vector<const avatar::AvatarRecord*> available;
		std::copy_if(eligible.begin(), eligible.end(), std::back_inserter(available),
		             [&blocked](const avatar::AvatarRecord* record) { return !blocked.contains(record->userId); });
		if (available.empty()) {
			continue;
		}

		std::uniform_int_distribution<std::size_t> pick(0u, available.size() - 1u);
		target               = available[pick(rng)];
		result.evictedRecent = evicted;
	}
	if (target == nullptr) {
		return result;
	}

	// Decoys: random order, then name-dissimilar users first.
	std::vector<const avatar::AvatarRecord*> others;
	others.reserve(eligible.size() - 1u);
	std::copy_if(eligible.begin(), eligible.end(), std::back_inserter(others), [target](const avatar::AvatarRecord* record) { return record != target; });
	std::shuffle(others.begin(), others.end(), rng);
	if (options.preferDissimilarNames) {
		std::stable_partition(others.begin(), others.end(),
		                      [target](const avatar::AvatarRecord* record) { return isNameDissimilar(target->displayName, record->displayName); });
	}

	Round& round       = result.round;
	round.targetUserId = target->userId;
	round.candidates.reserve(candidateCount);
	round.candidates.push_back(toCandidate(*target));
	for (std::size_t i = 0; i + 1u < candidateCount; ++i) {
		round.candidates.push_back(toCandidate(*others[i]));
	}
	std::shuffle(round.candidates.begin(), round.candidates.end(), rng);

	result.success = true;
	return result;
}

} // namespace whoisit::game
