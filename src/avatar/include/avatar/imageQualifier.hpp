#pragma once

#include "avatar/debugVisualizer.hpp"
#include "avatar/faceDetector.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace whoisit::avatar {

//! Why an avatar cannot be used for the guessing game.
enum class RejectionReason {
	None,                  //!< Usable.
	NoFaceDetected,        //!< Also used for blank and undecodable images.
	MultipleFacesDetected, //!< Group photo or composite.
	LowConfidence,         //!< Something face-like, but below the confidence threshold.
	TooSmall,              //!< One face, but too small a share of the image. May pass after a higher resolution fetch.
	DuplicateOfExisting,   //!< Same picture as another user's qualified avatar (placeholder images).
};

std::string_view toString(RejectionReason reason);

//! TooSmall and DuplicateOfExisting may change on a re-check of the same image; the others cannot.
bool isRetryable(RejectionReason reason);

struct QualificationVerdict {
	bool usable{false};
	RejectionReason reason{RejectionReason::NoFaceDetected};
	float confidence{0.0f};       //!< Confidence of the accepted face, else of the strongest candidate. 0 if none.
	int faceCount{0};             //!< Candidates at or above the confidence threshold.
	std::optional<cv::Rect> face; //!< Accepted face, or strongest candidate. Working image coordinates.

	bool operator==(const QualificationVerdict& other) const = default;
};

struct QualifierConfig {
	float confidenceThreshold{0.5f};   //!< Minimum detector confidence for a region to count as a face.
	double minFaceAreaFraction{0.02};  //!< Face box area / image area below this -> TooSmall.
	int maxWorkingDimension{512};      //!< Larger images are downscaled before detection.
	double blankStdDevMax{4.0};        //!< Grayscale standard deviation at or below this -> blank image.
};

//! Decode encoded image bytes (PNG, JPEG, ...) to 8-bit BGR.
//! \returns Empty matrix for empty or undecodable input. Never throws.
cv::Mat decodeImage(const std::vector<std::uint8_t>& bytes);

/*! Decides whether an avatar is a usable single face photograph.
 *  Stateless apart from the detector, which is itself safe for concurrent use. Identical input and
 *  configuration always give identical verdicts.
 */
class ImageQualifier {
public:
	explicit ImageQualifier(std::shared_ptr<const FaceDetector> detector, QualifierConfig config = QualifierConfig{});

	//! Decode and qualify. Undecodable input yields NoFaceDetected.
	QualificationVerdict qualify(const std::vector<std::uint8_t>& bytes, DebugVisualizer* debugger = nullptr) const;

	//! Qualify an already decoded BGR (or grayscale/BGRA) image.
	QualificationVerdict qualify(const cv::Mat& image, DebugVisualizer* debugger = nullptr) const;

	const QualifierConfig& config() const {
		return m_config;
	}
	const FaceDetector& detector() const {
		return *m_detector;
	}

private:
	std::shared_ptr<const FaceDetector> m_detector;
	QualifierConfig m_config;
};

} // namespace whoisit::avatar
