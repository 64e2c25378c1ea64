#include "avatar/imageQualifier.hpp"

#include <algorithm>
#include <string>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace whoisit::avatar {

namespace {

//! Bring any decoded layout to 8-bit BGR.
static bool convertToBgr(const cv::Mat& image, cv::Mat& outBgr) {
	cv::Mat image8;
	if (image.depth() == CV_8U) {
		image8 = image;
	} else if (image.depth() == CV_16U) {
		image.convertTo(image8, CV_8U, 1.0 / 257.0);
	} else {
		return false;
	}

	switch (image8.channels()) {
	case 1:
		cv::cvtColor(image8, outBgr, cv::COLOR_GRAY2BGR);
		return true;
	case 3:
		outBgr = image8;
		return true;
	case 4:
		cv::cvtColor(image8, outBgr, cv::COLOR_BGRA2BGR);
		return true;
	default:
		return false;
	}
}

static cv::Mat toWorkingSize(const cv::Mat& bgr, int maxDimension) {
	const int longest = std::max(bgr.cols, bgr.rows);
	if (maxDimension <= 0 || longest <= maxDimension) {
		return bgr;
	}
	const double scale = static_cast<double>(maxDimension) / static_cast<double>(longest);
	cv::Mat resized;
	cv::resize(bgr, resized, cv::Size(), scale, scale, cv::INTER_AREA);
	return resized;
}

static bool isBlank(const cv::Mat& bgr, double maxStdDev) {
	cv::Mat gray;
	cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
	cv::Scalar mean, stddev;
	cv::meanStdDev(gray, mean, stddev);
	return stddev[0] <= maxStdDev;
}

static QualificationVerdict rejected(RejectionReason reason, float confidence = 0.0f, int faceCount = 0, std::optional<cv::Rect> face = std::nullopt) {
	return QualificationVerdict{false, reason, confidence, faceCount, face};
}

} // namespace

std::string_view toString(const RejectionReason reason) {
	switch (reason) {
	case RejectionReason::None:
		return "None";
	case RejectionReason::NoFaceDetected:
		return "NoFaceDetected";
	case RejectionReason::MultipleFacesDetected:
		return "MultipleFacesDetected";
	case RejectionReason::LowConfidence:
		return "LowConfidence";
	case RejectionReason::TooSmall:
		return "TooSmall";
	case RejectionReason::DuplicateOfExisting:
		return "DuplicateOfExisting";
	}
	return "Unknown";
}

bool isRetryable(const RejectionReason reason) {
	return reason == RejectionReason::TooSmall || reason == RejectionReason::DuplicateOfExisting;
}

cv::Mat decodeImage(const std::vector<std::uint8_t>& bytes) {
	if (bytes.empty()) {
		return {};
	}

	cv::Mat decoded;
	try {
		decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		spdlog::warn("Image decoding failed ({} bytes): {}", bytes.size(), e.what());
		return {};
	}
	return decoded;
}


ImageQualifier::ImageQualifier(std::shared_ptr<const FaceDetector> detector, QualifierConfig config)
    : m_detector(std::move(detector)), m_config(config) {
	if (!m_detector) {
		m_detector = std::make_shared<SkinBlobFaceDetector>();
	}
}

QualificationVerdict ImageQualifier::qualify(const std::vector<std::uint8_t>& bytes, DebugVisualizer* debugger) const {
	const cv::Mat image = decodeImage(bytes);
	if (image.empty()) {
		spdlog::debug("Avatar bytes could not be decoded ({} bytes)", bytes.size());
		return rejected(RejectionReason::NoFaceDetected);
	}
	return qualify(image, debugger);
}

QualificationVerdict ImageQualifier::qualify(const cv::Mat& image, DebugVisualizer* debugger) const {
	cv::Mat bgr;
	if (image.empty() || !convertToBgr(image, bgr)) {
		return rejected(RejectionReason::NoFaceDetected);
	}

	const cv::Mat working = toWorkingSize(bgr, m_config.maxWorkingDimension);
	if (debugger) {
		debugger->beginStage("Input");
		debugger->add("Working Image", working);
		debugger->endStage();
	}

	if (isBlank(working, m_config.blankStdDevMax)) {
		return rejected(RejectionReason::NoFaceDetected);
	}

	std::vector<FaceRegion> regions;
	try {
		regions = m_detector->detect(working, debugger);
	} catch (const cv::Exception& e) {
		spdlog::warn("Face detector '{}' failed: {}", m_detector->name(), e.what());
		return rejected(RejectionReason::NoFaceDetected);
	}

	if (regions.empty()) {
		return rejected(RejectionReason::NoFaceDetected);
	}

	const auto strongest = std::max_element(regions.begin(), regions.end(), [](const FaceRegion& a, const FaceRegion& b) { return a.confidence < b.confidence; });
	const float threshold = m_config.confidenceThreshold;
	const int faceCount   = static_cast<int>(std::count_if(regions.begin(), regions.end(), [threshold](const FaceRegion& r) { return r.confidence >= threshold; }));

	QualificationVerdict verdict{};
	if (faceCount == 0) {
		verdict = rejected(RejectionReason::LowConfidence, strongest->confidence, 0, strongest->box);
	} else if (faceCount > 1) {
		verdict = rejected(RejectionReason::MultipleFacesDetected, strongest->confidence, faceCount, strongest->box);
	} else {
		const double imageArea    = static_cast<double>(working.cols) * static_cast<double>(working.rows);
		const double areaFraction = static_cast<double>(strongest->box.area()) / imageArea;
		if (areaFraction < m_config.minFaceAreaFraction) {
			verdict = rejected(RejectionReason::TooSmall, strongest->confidence, 1, strongest->box);
		} else {
			verdict = QualificationVerdict{true, RejectionReason::None, strongest->confidence, 1, strongest->box};
		}
	}

	if (debugger) {
		debugger->beginStage("Verdict");
		cv::Mat overlay = working.clone();
		if (verdict.face) {
			cv::rectangle(overlay, *verdict.face, verdict.usable ? cv::Scalar(0, 220, 0) : cv::Scalar(0, 0, 230), 3);
		}
		debugger->add(std::string(toString(verdict.reason)), overlay);
		debugger->endStage();
	}

	return verdict;
}

} // namespace whoisit::avatar
