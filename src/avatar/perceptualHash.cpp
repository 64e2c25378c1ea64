#include "avatar/perceptualHash.hpp"

#include <bit>
#include <format>

#include <opencv2/imgproc.hpp>

namespace whoisit::avatar {

Fingerprint differenceHash(const cv::Mat& image) {
	static constexpr int HASH_W = 9;
	static constexpr int HASH_H = 8;

	if (image.empty()) {
		return 0u;
	}

	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image;
		break;
	case 4:
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
		break;
	default:
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		break;
	}

	cv::Mat small;
	cv::resize(gray, small, cv::Size(HASH_W, HASH_H), 0.0, 0.0, cv::INTER_AREA);
	small.convertTo(small, CV_32F);

	Fingerprint hash = 0u;
	for (int y = 0; y < HASH_H; ++y) {
		for (int x = 0; x < HASH_W - 1; ++x) {
			hash <<= 1u;
			if (small.at<float>(y, x) < small.at<float>(y, x + 1)) {
				hash |= 1u;
			}
		}
	}
	return hash;
}

int hammingDistance(const Fingerprint a, const Fingerprint b) {
	return std::popcount(a ^ b);
}

std::uint64_t contentDigest(const std::vector<std::uint8_t>& bytes) {
	static constexpr std::uint64_t FNV_OFFSET = 14695981039346656037ull;
	static constexpr std::uint64_t FNV_PRIME  = 1099511628211ull;

	std::uint64_t digest = FNV_OFFSET;
	for (const std::uint8_t byte: bytes) {
		digest ^= byte;
		digest *= FNV_PRIME;
	}
	return digest;
}

std::string toHex(const std::uint64_t value) {
	return std::format("{:016x}", value);
}

} // namespace whoisit::avatar
