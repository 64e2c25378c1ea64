#pragma once

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace whoisit::avatar {

using Fingerprint = std::uint64_t;

//! 64 bit difference hash: grayscale, area-resized to 9x8, one bit per horizontally adjacent pair (left < right).
//! Survives re-encoding and rescaling, so default placeholder avatars served at different sizes still collide.
//! \returns 0 for an empty image.
Fingerprint differenceHash(const cv::Mat& image);

//! Number of differing bits.
int hammingDistance(Fingerprint a, Fingerprint b);

inline bool isNearDuplicate(Fingerprint a, Fingerprint b, int maxDistance) {
	return hammingDistance(a, b) <= maxDistance;
}

//! FNV-1a digest of the raw bytes. Detects an unchanged upload without decoding it.
std::uint64_t contentDigest(const std::vector<std::uint8_t>& bytes);

//! Fixed width (16 digit) lower case hex.
std::string toHex(std::uint64_t value);

} // namespace whoisit::avatar
