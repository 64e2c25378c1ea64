#pragma once

#include "avatar/faceDetector.hpp"
#include "avatar/imageQualifier.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace whoisit::avatar {

struct Analysis {
	cv::Mat mosaic;               //!< Debug output of every pipeline stage, or an info tile on failure.
	QualificationVerdict verdict; //!< NoFaceDetected if the file could not be loaded.
	std::string summary;          //!< One line for the status label.
};

//! Runs the qualification pipeline with a DebugVisualizer attached.
class Analyser {
public:
	Analyser(std::shared_ptr<const FaceDetector> detector, QualifierConfig config);

	Analysis analyse(const std::filesystem::path& path) const;

	QualifierConfig& config() {
		return m_config;
	}

private:
	std::shared_ptr<const FaceDetector> m_detector;
	QualifierConfig m_config;
};

} // namespace whoisit::avatar
