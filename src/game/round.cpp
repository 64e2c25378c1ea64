#include "game/round.hpp"

#include <algorithm>
#include <set>

namespace whoisit::game {

const Candidate* Round::target() const {
	return findCandidate(targetUserId);
}

const Candidate* Round::findCandidate(const std::string& userId) const {
	const auto it = std::find_if(candidates.begin(), candidates.end(), [&userId](const Candidate& c) { return c.userId == userId; });
	return it == candidates.end() ? nullptr : &*it;
}

bool isValidRound(const Round& round) {
	if (round.candidates.empty() || round.targetUserId.empty()) {
		return false;
	}

	std::set<std::string> seen;
	for (const auto& candidate: round.candidates) {
		if (candidate.userId.empty() || !seen.insert(candidate.userId).second) {
			return false;
		}
	}
	return seen.contains(round.targetUserId);
}

void RecentTargets::push(std::string userId) {
	if (m_capacity == 0u) {
		return;
	}
	m_entries.push_back(std::move(userId));
	while (m_entries.size() > m_capacity) {
		m_entries.pop_front();
	}
}

void RecentTargets::dropOldest(std::size_t count) {
	count = std::min(count, m_entries.size());
	m_entries.erase(m_entries.begin(), m_entries.begin() + static_cast<std::ptrdiff_t>(count));
}

bool RecentTargets::contains(const std::string& userId) const {
	return std::find(m_entries.begin(), m_entries.end(), userId) != m_entries.end();
}

} // namespace whoisit::game
