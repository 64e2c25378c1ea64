#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace whoisit::game {

using Clock = std::chrono::steady_clock;

//! One selectable option shown to the player.
struct Candidate {
	std::string userId;
	std::string displayName;
	std::string imageReference;
};

//! A single "who is this" question.
struct Round {
	std::uint64_t roundId{0u};
	std::string targetUserId;
	std::vector<Candidate> candidates; //!< Target included exactly once, shuffled.
	Clock::time_point createdAt{};
	Clock::time_point expiresAt{};

	const Candidate* target() const;                      //!< Null if the target is missing from the candidates.
	const Candidate* findCandidate(const std::string& userId) const;
	bool isExpired(Clock::time_point now) const {
		return now >= expiresAt;
	}
};

//! Candidates are non-empty, distinct, and contain the target exactly once.
bool isValidRound(const Round& round);

//! Bounded history of recent targets. Oldest entries are evicted first.
class RecentTargets {
public:
	explicit RecentTargets(std::size_t capacity) : m_capacity(capacity) {
	}

	void push(std::string userId); //!< Appends and evicts the oldest entries beyond capacity. No-op at capacity 0.
	void dropOldest(std::size_t count);
	bool contains(const std::string& userId) const;

	const std::deque<std::string>& entries() const { //!< Oldest first.
		return m_entries;
	}
	std::size_t size() const {
		return m_entries.size();
	}
	std::size_t capacity() const {
		return m_capacity;
	}

private:
	std::size_t m_capacity;
	std::deque<std::string> m_entries;
};

} // namespace whoisit::game
