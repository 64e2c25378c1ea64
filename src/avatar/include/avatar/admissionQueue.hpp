#pragma once

#include "avatar/avatarPool.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace whoisit::avatar {

/*! Runs AvatarPool admissions on a small set of worker threads, so that face detection never blocks guess handling.
 *  Process: The owner
 *   - Connects an optional callback to observe every admission result.
 *   - Calls start() once, then submitAll() on every roster sync tick (triggered by an external timer).
 *   - Calls stop() (or destroys the queue) on shutdown. Pending submissions are dropped; in-flight ones finish.
 *  Pending submissions for the same user are coalesced (latest wins) and one user is never admitted by two
 *  workers at once, so the last submitted image for a user is always the one that ends up in the pool.
 */
class AdmissionQueue {
public:
	struct Callbacks {
		std::function<void(const AdmissionResult&)> onAdmitted; //!< Called from a worker thread after each admission.
	};

public:
	explicit AdmissionQueue(AvatarPool& pool, unsigned workerCount = 2u);
	~AdmissionQueue();

	AdmissionQueue(const AdmissionQueue&)            = delete;
	AdmissionQueue& operator=(const AdmissionQueue&) = delete;

	void connect(Callbacks callbacks); //!< Set before start().
	void disconnect();

	void start();
	void stop();
	bool running() const {
		return m_running.load();
	}

	void submit(AvatarSubmission submission);
	void submitAll(std::vector<AvatarSubmission> submissions); //!< One roster sync tick.

	//! Block until nothing is pending or in flight. Returns immediately when not running.
	void waitIdle();

	std::size_t pending() const;

private:
	void workerLoop();
	bool takeNext(AvatarSubmission& out); //!< Requires m_mutex. Picks the oldest user that is not in flight.

private:
	AvatarPool& m_pool;
	unsigned m_workerCount;
	Callbacks m_callbacks{};

	mutable std::mutex m_mutex;
	std::condition_variable m_workAvailable;
	std::condition_variable m_idle;
	std::deque<std::string> m_order;                   //!< User ids in submission order.
	std::map<std::string, AvatarSubmission> m_pending; //!< Latest submission per user id.
	std::set<std::string> m_inFlight;

	std::atomic<bool> m_running{false};
	std::vector<std::thread> m_workers;
};

} // namespace whoisit::avatar
