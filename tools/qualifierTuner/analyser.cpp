#include "analyser.hpp"

#include "avatar/debugVisualizer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <vector>

namespace whoisit::avatar {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

//! Raw file content, so the tuner sees exactly what the pool would get from the user store.
static std::vector<std::uint8_t> readBytes(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		return {};
	}
	return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}


Analyser::Analyser(std::shared_ptr<const FaceDetector> detector, QualifierConfig config) : m_detector(std::move(detector)), m_config(config) {
}

Analysis Analyser::analyse(const std::filesystem::path& path) const {
	Analysis analysis{};

	const auto bytes = readBytes(path);
	if (bytes.empty()) {
		analysis.mosaic  = buildInfoTile("Input Error", "Could not read " + path.filename().string());
		analysis.summary = "Could not read file";
		return analysis;
	}

	const ImageQualifier qualifier(m_detector, m_config);
	DebugVisualizer debugger;
	analysis.verdict = qualifier.qualify(bytes, &debugger);
	analysis.summary = std::format("{}: {} (confidence {:.2f}, {} face(s) at or above {:.2f})", analysis.verdict.usable ? "Usable" : "Rejected",
	                               toString(analysis.verdict.reason), analysis.verdict.confidence, analysis.verdict.faceCount,
	                               m_config.confidenceThreshold);

	analysis.mosaic = debugger.buildMosaic();
	if (analysis.mosaic.empty()) {
		analysis.mosaic = buildInfoTile("No Debug Output", "The image could not be decoded.");
	}
	return analysis;
}

} // namespace whoisit::avatar
