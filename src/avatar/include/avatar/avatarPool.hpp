#pragma once

#include "avatar/imageQualifier.hpp"
#include "avatar/perceptualHash.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace whoisit::avatar {

enum class QualificationStatus { Unchecked, Qualified, Rejected };

std::string_view toString(QualificationStatus status);

//! Everything the pool knows about one user's avatar.
struct AvatarRecord {
	std::string userId;
	std::string displayName;
	std::string imageReference;                    //!< Upstream reference (URL). Hex content digest when none was given.
	std::uint64_t contentDigest{0u};               //!< Digest of the raw bytes last admitted.
	Fingerprint fingerprint{0u};                   //!< Perceptual hash. 0 if the image could not be decoded.
	QualificationStatus status{QualificationStatus::Unchecked};
	RejectionReason reason{RejectionReason::None}; //!< Set when status is Rejected.
	float confidence{0.0f};
	std::string duplicateOf{};                     //!< Qualified holder of the same picture when reason is DuplicateOfExisting.
	std::chrono::system_clock::time_point lastCheckedAt{};
};

//! One roster entry handed over by the user store synchronizer.
struct AvatarSubmission {
	std::string userId;
	std::string displayName;
	std::string imageReference; //!< Optional. Empty -> the content digest is used as reference.
	std::vector<std::uint8_t> bytes;
};

//! Immutable point-in-time view of the qualified records, sorted by user id.
struct PoolSnapshot {
	std::uint64_t version{0u}; //!< Increases with every published change.
	std::vector<AvatarRecord> records;
};
using PoolSnapshotPtr = std::shared_ptr<const PoolSnapshot>;

enum class AdmissionOutcome {
	Qualified, //!< Newly (re)qualified.
	Rejected,  //!< Checked and rejected. See record.reason.
	Unchanged, //!< Same image as before and no re-check needed. Only the display name may have been updated.
	Invalid,   //!< Submission without user id. Nothing stored.
};

struct AdmissionResult {
	AdmissionOutcome outcome;
	AvatarRecord record;
};

struct PoolConfig {
	int duplicateMaxDistance{6}; //!< Fingerprints within this Hamming distance are the same picture.
};

/*! Owns the avatar records and publishes snapshots of the qualified ones.
 *  Thread-safe. Admissions for the same user id are serialized; different users are admitted
 *  concurrently and the slow qualification runs outside the pool lock. The duplicate check and the
 *  commit happen atomically, so a picture is never Qualified for two users at once.
 *  Records are never removed.
 */
class AvatarPool {
public:
	explicit AvatarPool(std::shared_ptr<const ImageQualifier> qualifier, PoolConfig config = PoolConfig{});

	AdmissionResult admit(const AvatarSubmission& submission);
	AdmissionResult admit(const std::string& userId, const std::string& displayName, const std::vector<std::uint8_t>& bytes);

	//! Current qualified records. Cheap: returns the shared published snapshot.
	PoolSnapshotPtr qualifiedSnapshot() const;

	std::optional<AvatarRecord> find(const std::string& userId) const;
	std::size_t size() const;
	std::size_t qualifiedCount() const;

	//! Force the next admission of this user to run the qualifier even for an unchanged image.
	//! The record becomes Unchecked and leaves the snapshot until it qualifies again.
	//! \returns False for unknown users.
	bool requestRecheck(const std::string& userId);

	const ImageQualifier& qualifier() const {
		return *m_qualifier;
	}

private:
	static constexpr std::size_t LOCK_STRIPES = 64u;

	std::mutex& userLock(const std::string& userId);
	const AvatarRecord* findQualifiedDuplicate(const std::string& userId, Fingerprint fingerprint) const; //!< Requires m_mutex.
	void publishSnapshot();                                                                              //!< Requires m_mutex.

private:
	std::shared_ptr<const ImageQualifier> m_qualifier;
	PoolConfig m_config;

	std::array<std::mutex, LOCK_STRIPES> m_userLocks; //!< Per user serialization, striped by hash of the id.

	mutable std::mutex m_mutex; //!< Guards the records and the published snapshot.
	std::map<std::string, AvatarRecord> m_records;
	PoolSnapshotPtr m_snapshot;
	std::uint64_t m_version{0u};
};

} // namespace whoisit::avatar
