#include "modelFaceDetectors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace whoisit::avatar {

namespace {

static void addOverlay(DebugVisualizer* debugger, const std::string& stage, const cv::Mat& image, const std::vector<FaceRegion>& regions) {
	if (!debugger) {
		return;
	}
	std::vector<cv::Rect> boxes;
	std::vector<float> confidences;
	for (const auto& region: regions) {
		boxes.push_back(region.box);
		confidences.push_back(region.confidence);
	}
	debugger->beginStage(stage);
	debugger->add("Candidates", DebugVisualizer::drawRegions(image, boxes, confidences));
	debugger->endStage();
}

} // namespace

CascadeFaceDetector::CascadeFaceDetector(const DetectorConfig& config) : m_config(config) {
}

bool CascadeFaceDetector::load(const std::string& cascadePath) {
	std::lock_guard lock(m_mutex);
	try {
		if (!m_cascade.load(cascadePath) || m_cascade.empty()) {
			spdlog::error("Could not load face cascade '{}'", cascadePath);
			return false;
		}
	} catch (const cv::Exception& e) {
		spdlog::error("Could not load face cascade '{}': {}", cascadePath, e.what());
		return false;
	}
	return true;
}

std::vector<FaceRegion> CascadeFaceDetector::detect(const cv::Mat& image, DebugVisualizer* debugger) const {
	if (image.empty()) {
		return {};
	}

	cv::Mat gray;
	cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
	cv::equalizeHist(gray, gray);

	std::vector<cv::Rect> boxes;
	std::vector<int> rejectLevels;
	std::vector<double> levelWeights;
	{
		std::lock_guard lock(m_mutex);
		if (m_cascade.empty()) {
			return {};
		}
		try {
			m_cascade.detectMultiScale(gray, boxes, rejectLevels, levelWeights, m_config.cascadeScaleFactor, m_config.cascadeMinNeighbors, 0,
			                           cv::Size(m_config.cascadeMinSize, m_config.cascadeMinSize), cv::Size(), true);
		} catch (const cv::Exception& e) {
			spdlog::warn("Cascade detection failed: {}", e.what());
			return {};
		}
	}

	std::vector<FaceRegion> regions;
	regions.reserve(boxes.size());
	for (std::size_t i = 0; i < boxes.size(); ++i) {
		const double weight = i < levelWeights.size() ? levelWeights[i] : 0.0;
		regions.push_back(FaceRegion{boxes[i], cascadeConfidence(weight, m_config)});
	}
	std::sort(regions.begin(), regions.end(), [](const FaceRegion& a, const FaceRegion& b) { return a.confidence > b.confidence; });

	addOverlay(debugger, "Cascade", image, regions);
	return regions;
}


YuNetFaceDetector::YuNetFaceDetector(const DetectorConfig& config) : m_config(config) {
}

bool YuNetFaceDetector::load(const std::string& modelPath) {
	std::lock_guard lock(m_mutex);
	try {
		m_yunet = cv::FaceDetectorYN::create(modelPath, "", cv::Size(320, 320), m_config.yunetScoreThreshold, m_config.yunetNmsThreshold,
		                                     m_config.yunetTopK);
	} catch (const cv::Exception& e) {
		spdlog::error("Could not load YuNet model '{}': {}", modelPath, e.what());
		m_yunet.reset();
		return false;
	}
	m_inputSize = cv::Size(0, 0);
	return !m_yunet.empty();
}

std::vector<FaceRegion> YuNetFaceDetector::detect(const cv::Mat& image, DebugVisualizer* debugger) const {
	if (image.empty()) {
		return {};
	}

	cv::Mat detections;
	{
		std::lock_guard lock(m_mutex);
		if (m_yunet.empty()) {
			return {};
		}
		try {
			if (image.size() != m_inputSize) {
				m_yunet->setInputSize(image.size());
				m_inputSize = image.size();
			}
			m_yunet->detect(image, detections);
		} catch (const cv::Exception& e) {
			spdlog::warn("YuNet detection failed: {}", e.what());
			return {};
		}
	}

	const auto regions = parseYuNetDetections(detections, image.size());
	addOverlay(debugger, "YuNet", image, regions);
	return regions;
}


float cascadeConfidence(double levelWeight, const DetectorConfig& config) {
	const double slope = config.cascadeWeightSlope > 0.0 ? config.cascadeWeightSlope : 1.0;
	return static_cast<float>(1.0 / (1.0 + std::exp(-(levelWeight - config.cascadeWeightMidpoint) / slope)));
}

std::vector<FaceRegion> parseYuNetDetections(const cv::Mat& detections, cv::Size imageSize) {
	// Rows: x, y, w, h, 5 landmarks (10 values), score.
	std::vector<FaceRegion> regions;
	if (detections.empty() || detections.cols < 15 || detections.type() != CV_32F) {
		return regions;
	}

	const cv::Rect bounds(cv::Point(0, 0), imageSize);
	for (int row = 0; row < detections.rows; ++row) {
		const cv::Rect box(cv::Point(cvRound(detections.at<float>(row, 0)), cvRound(detections.at<float>(row, 1))),
		                   cv::Size(cvRound(detections.at<float>(row, 2)), cvRound(detections.at<float>(row, 3))));
		const float score = std::clamp(detections.at<float>(row, 14), 0.0f, 1.0f);

		const cv::Rect clipped = box & bounds;
		if (clipped.area() > 0) {
			regions.push_back(FaceRegion{clipped, score});
		}
	}
	std::sort(regions.begin(), regions.end(), [](const FaceRegion& a, const FaceRegion& b) { return a.confidence > b.confidence; });
	return regions;
}

std::unique_ptr<FaceDetector> createFaceDetector(const DetectorConfig& config) {
	switch (config.backend) {
	case DetectorBackend::SkinBlob:
		return std::make_unique<SkinBlobFaceDetector>(config.skin);

	case DetectorBackend::Cascade: {
		if (config.modelPath.empty() || !std::filesystem::exists(config.modelPath)) {
			spdlog::error("Cascade detector needs an existing model file, got '{}'", config.modelPath);
			return nullptr;
		}
		auto detector = std::make_unique<CascadeFaceDetector>(config);
		if (!detector->load(config.modelPath)) {
			return nullptr;
		}
		return detector;
	}

	case DetectorBackend::YuNet: {
		if (config.modelPath.empty() || !std::filesystem::exists(config.modelPath)) {
			spdlog::error("YuNet detector needs an existing model file, got '{}'", config.modelPath);
			return nullptr;
		}
		auto detector = std::make_unique<YuNetFaceDetector>(config);
		if (!detector->load(config.modelPath)) {
			return nullptr;
		}
		return detector;
	}
	}
	return nullptr;
}

bool parseDetectorBackend(const std::string& name, DetectorBackend& out) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lower == "skin" || lower == "skinblob") {
		out = DetectorBackend::SkinBlob;
	} else if (lower == "cascade" || lower == "haar") {
		out = DetectorBackend::Cascade;
	} else if (lower == "yunet") {
		out = DetectorBackend::YuNet;
	} else {
		return false;
	}
	return true;
}

} // namespace whoisit::avatar
