#pragma once

#include "avatar/faceDetector.hpp"

#include <opencv2/objdetect.hpp>

#include <mutex>
#include <string>

namespace whoisit::avatar {

//! Viola-Jones detector on an OpenCV Haar/LBP cascade file.
//! cv::CascadeClassifier keeps per-call scratch state, so detect() serializes on an internal mutex.
class CascadeFaceDetector final : public FaceDetector {
public:
	explicit CascadeFaceDetector(const DetectorConfig& config);

	//! \returns False if the cascade file is missing or invalid.
	bool load(const std::string& cascadePath);

	std::vector<FaceRegion> detect(const cv::Mat& image, DebugVisualizer* debugger) const override;
	std::string name() const override {
		return "cascade";
	}

private:
	DetectorConfig m_config;
	mutable cv::CascadeClassifier m_cascade;
	mutable std::mutex m_mutex;
};

//! YuNet CNN face detector (cv::FaceDetectorYN, OpenCV >= 4.5.4).
class YuNetFaceDetector final : public FaceDetector {
public:
	explicit YuNetFaceDetector(const DetectorConfig& config);

	//! \returns False if the ONNX model cannot be loaded.
	bool load(const std::string& modelPath);

	std::vector<FaceRegion> detect(const cv::Mat& image, DebugVisualizer* debugger) const override;
	std::string name() const override {
		return "yunet";
	}

private:
	DetectorConfig m_config;
	cv::Ptr<cv::FaceDetectorYN> m_yunet;
	mutable cv::Size m_inputSize{0, 0}; //!< Last size passed to setInputSize.
	mutable std::mutex m_mutex;
};

} // namespace whoisit::avatar
