#include "avatar/admissionQueue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace whoisit::avatar {

AdmissionQueue::AdmissionQueue(AvatarPool& pool, unsigned workerCount) : m_pool(pool), m_workerCount(std::max(1u, workerCount)) {
}

AdmissionQueue::~AdmissionQueue() {
	stop();
	disconnect();
}

void AdmissionQueue::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void AdmissionQueue::disconnect() {
	m_callbacks = {nullptr};
}

void AdmissionQueue::start() {
	{
		std::lock_guard lock(m_mutex);
		if (m_running.exchange(true)) {
			return;
		}
	}

	m_workers.reserve(m_workerCount);
	for (unsigned i = 0; i < m_workerCount; ++i) {
		m_workers.emplace_back([this]() { workerLoop(); });
	}
	spdlog::debug("Admission queue started with {} workers", m_workerCount);
}

void AdmissionQueue::stop() {
	{
		std::lock_guard lock(m_mutex);
		if (!m_running.exchange(false)) {
			return;
		}
	}
	m_workAvailable.notify_all();

	for (auto& worker: m_workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	m_workers.clear();

	std::size_t dropped = 0u;
	{
		std::lock_guard lock(m_mutex);
		dropped = m_pending.size();
		m_pending.clear();
		m_order.clear();
		m_inFlight.clear();
	}
	m_idle.notify_all();

	if (dropped > 0u) {
		spdlog::info("Admission queue stopped, {} pending submissions dropped", dropped);
	}
}

void AdmissionQueue::submit(AvatarSubmission submission) {
	{
		std::lock_guard lock(m_mutex);
		const auto it = m_pending.find(submission.userId);
		if (it != m_pending.end()) {
			it->second = std::move(submission);
		} else {
			m_order.push_back(submission.userId);
			m_pending.emplace(submission.userId, std::move(submission));
		}
	}
	m_workAvailable.notify_one();
}

void AdmissionQueue::submitAll(std::vector<AvatarSubmission> submissions) {
	const std::size_t count = submissions.size();
	for (auto& submission: submissions) {
		submit(std::move(submission));
	}
	spdlog::debug("Queued {} avatar submissions", count);
}

void AdmissionQueue::waitIdle() {
	std::unique_lock lock(m_mutex);
	m_idle.wait(lock, [this]() { return !m_running.load() || (m_pending.empty() && m_inFlight.empty()); });
}

std::size_t AdmissionQueue::pending() const {
	std::lock_guard lock(m_mutex);
	return m_pending.size();
}

bool AdmissionQueue::takeNext(AvatarSubmission& out) {
	const auto it = std::find_if(m_order.begin(), m_order.end(), [this](const std::string& userId) { return !m_inFlight.contains(userId); });
	if (it == m_order.end()) {
		return false;
	}

	const std::string userId = *it;
	m_order.erase(it);

	auto node = m_pending.extract(userId);
	out       = std::move(node.mapped());
	m_inFlight.insert(userId);
	return true;
}

void AdmissionQueue::workerLoop() {
	while (true) {
		AvatarSubmission job;
		{
			std::unique_lock lock(m_mutex);
			m_workAvailable.wait(lock, [this]() {
				return !m_running.load() ||
				       std::any_of(m_order.begin(), m_order.end(), [this](const std::string& userId) { return !m_inFlight.contains(userId); });
			});
			if (!m_running.load()) {
				return;
			}
			if (!takeNext(job)) {
				continue;
			}
		}

		try {
			const AdmissionResult result = m_pool.admit(job);
			if (m_callbacks.onAdmitted) {
				m_callbacks.onAdmitted(result);
			}
		} catch (const std::exception& e) {
			spdlog::error("Admission of {} failed: {}", job.userId, e.what());
		}

		{
			std::lock_guard lock(m_mutex);
			m_inFlight.erase(job.userId);
			if (m_pending.empty() && m_inFlight.empty()) {
				m_idle.notify_all();
			}
		}
		// A newer submission for the same user may have been waiting on this one.
		m_workAvailable.notify_all();
	}
}

} // namespace whoisit::avatar
