#include "avatar/avatarPool.hpp"

#include <functional>

#include <spdlog/spdlog.h>

namespace whoisit::avatar {

std::string_view toString(const QualificationStatus status) {
	switch (status) {
	case QualificationStatus::Unchecked:
		return "Unchecked";
	case QualificationStatus::Qualified:
		return "Qualified";
	case QualificationStatus::Rejected:
		return "Rejected";
	}
	return "Unknown";
}

AvatarPool::AvatarPool(std::shared_ptr<const ImageQualifier> qualifier, PoolConfig config)
    : m_qualifier(std::move(qualifier)), m_config(config), m_snapshot(std::make_shared<const PoolSnapshot>()) {
	if (!m_qualifier) {
		m_qualifier = std::make_shared<const ImageQualifier>(nullptr);
	}
}

AdmissionResult AvatarPool::admit(const std::string& userId, const std::string& displayName, const std::vector<std::uint8_t>& bytes) {
	return admit(AvatarSubmission{userId, displayName, {}, bytes});
}

AdmissionResult AvatarPool::admit(const AvatarSubmission& submission) {
	if (submission.userId.empty()) {
		spdlog::warn("Ignoring avatar submission without user id ('{}')", submission.displayName);
		return {AdmissionOutcome::Invalid, AvatarRecord{}};
	}

	std::lock_guard userGuard(userLock(submission.userId));

	const std::uint64_t digest  = contentDigest(submission.bytes);
	const std::string reference = submission.imageReference.empty() ? toHex(digest) : submission.imageReference;

	// Skip the qualifier when the image is unchanged and its status cannot change on a re-check.
	{
		std::lock_guard lock(m_mutex);
		const auto it = m_records.find(submission.userId);
		if (it != m_records.end()) {
			AvatarRecord& existing = it->second;
			const bool sameImage   = existing.imageReference == reference && existing.contentDigest == digest;
			const bool settled     = existing.status == QualificationStatus::Qualified ||
			                     (existing.status == QualificationStatus::Rejected && !isRetryable(existing.reason));
			if (sameImage && settled) {
				if (existing.displayName != submission.displayName) {
					existing.displayName = submission.displayName;
					if (existing.status == QualificationStatus::Qualified) {
						publishSnapshot();
					}
				}
				return {AdmissionOutcome::Unchanged, existing};
			}
		}
	}

	const cv::Mat image                = decodeImage(submission.bytes);
	const QualificationVerdict verdict = m_qualifier->qualify(image);
	const Fingerprint fingerprint      = differenceHash(image);

	AvatarRecord record{};
	record.userId         = submission.userId;
	record.displayName    = submission.displayName;
	record.imageReference = reference;
	record.contentDigest  = digest;
	record.fingerprint    = fingerprint;
	record.confidence     = verdict.confidence;
	record.lastCheckedAt  = std::chrono::system_clock::now();

	std::lock_guard lock(m_mutex);
	if (verdict.usable) {
		if (const AvatarRecord* holder = findQualifiedDuplicate(record.userId, fingerprint)) {
			record.status      = QualificationStatus::Rejected;
			record.reason      = RejectionReason::DuplicateOfExisting;
			record.duplicateOf = holder->userId;
		} else {
			record.status = QualificationStatus::Qualified;
			record.reason = RejectionReason::None;
		}
	} else {
		record.status = QualificationStatus::Rejected;
		record.reason = verdict.reason;
	}

	const auto previous      = m_records.find(record.userId);
	const bool wasQualified  = previous != m_records.end() && previous->second.status == QualificationStatus::Qualified;
	const bool nowQualified  = record.status == QualificationStatus::Qualified;
	m_records[record.userId] = record;
	if (wasQualified || nowQualified) {
		publishSnapshot();
	}

	if (nowQualified) {
		spdlog::debug("Avatar of {} qualified (confidence {:.2f})", record.userId, record.confidence);
		return {AdmissionOutcome::Qualified, record};
	}

	if (record.reason == RejectionReason::DuplicateOfExisting) {
		spdlog::info("Avatar of {} rejected: same picture as {}", record.userId, record.duplicateOf);
	} else {
		spdlog::debug("Avatar of {} rejected: {} (confidence {:.2f})", record.userId, toString(record.reason), record.confidence);
	}
	return {AdmissionOutcome::Rejected, record};
}

PoolSnapshotPtr AvatarPool::qualifiedSnapshot() const {
	std::lock_guard lock(m_mutex);
	return m_snapshot;
}

std::optional<AvatarRecord> AvatarPool::find(const std::string& userId) const {
	std::lock_guard lock(m_mutex);
	const auto it = m_records.find(userId);
	if (it == m_records.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::size_t AvatarPool::size() const {
	std::lock_guard lock(m_mutex);
	return m_records.size();
}

std::size_t AvatarPool::qualifiedCount() const {
	std::lock_guard lock(m_mutex);
	return m_snapshot->records.size();
}

bool AvatarPool::requestRecheck(const std::string& userId) {
	std::lock_guard userGuard(userLock(userId));
	std::lock_guard lock(m_mutex);

	const auto it = m_records.find(userId);
	if (it == m_records.end()) {
		return false;
	}

	const bool wasQualified = it->second.status == QualificationStatus::Qualified;
	it->second.status       = QualificationStatus::Unchecked;
	it->second.reason       = RejectionReason::None;
	it->second.duplicateOf.clear();
	if (wasQualified) {
		publishSnapshot();
	}
	return true;
}

std::mutex& AvatarPool::userLock(const std::string& userId) {
	return m_userLocks[std::hash<std::string>{}(userId) % LOCK_STRIPES];
}

const AvatarRecord* AvatarPool::findQualifiedDuplicate(const std::string& userId, const Fingerprint fingerprint) const {
	for (const auto& [id, record]: m_records) {
		if (id == userId || record.status != QualificationStatus::Qualified) {
			continue;
		}
		if (isNearDuplicate(record.fingerprint, fingerprint, m_config.duplicateMaxDistance)) {
			return &record;
		}
	}
	return nullptr;
}

void AvatarPool::publishSnapshot() {
	auto snapshot     = std::make_shared<PoolSnapshot>();
	snapshot->version = ++m_version;
	for (const auto& [id, record]: m_records) {
		if (record.status == QualificationStatus::Qualified) {
			snapshot->records.push_back(record);
		}
	}
	m_snapshot = std::move(snapshot);
}

} // namespace whoisit::avatar
