#include "avatar/faceDetector.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace whoisit::avatar {

namespace {

// Skin blob pipeline:
// 1) SkinMask   -> YCrCb box threshold, opening to drop speckle.
// 2) Blobs      -> connected components above a minimum size.
// 3) Outline    -> fill the outer contour of each blob; non-skin pixels inside are the feature holes.
// 4) Gates      -> ellipse fill and aspect ratio must both be plausible, otherwise the blob is dropped.
// 5) Features   -> pair eye holes side by side and look for a mouth hole below each pair. One face per pair.

struct Hole {
	cv::Point2d centre; //!< Relative to the blob box.
	cv::Rect box;       //!< Relative to the blob box.
	int area{0};
};

struct BlobMetrics {
	cv::Rect box;
	int filledArea{0};
	double fill{0.0};
	double aspect{0.0};
	std::vector<Hole> holes;
};

struct EyePair {
	std::size_t left;
	std::size_t right;
};

constexpr double EYE_ASPECT_LIMIT = 2.0; // Eye holes are round-ish in both directions.

static double clamp01(double value) {
	return std::clamp(value, 0.0, 1.0);
}

static cv::Mat buildSkinMask(const cv::Mat& image, const SkinBlobConfig& config) {
	cv::Mat ycrcb;
	cv::cvtColor(image, ycrcb, cv::COLOR_BGR2YCrCb);

	cv::Mat mask;
	cv::inRange(ycrcb, cv::Scalar(0, config.crMin, config.cbMin), cv::Scalar(255, config.crMax, config.cbMax), mask);
	return mask;
}

static BlobMetrics measureBlob(const cv::Mat& labels, int label, const cv::Rect& box, const SkinBlobConfig& config) {
	BlobMetrics metrics{};
	metrics.box    = box;
	metrics.aspect = static_cast<double>(box.height) / static_cast<double>(std::max(1, box.width));

	const cv::Mat component = labels(box) == label;

	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(component.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
	if (contours.empty()) {
		return metrics;
	}

	const auto outer = std::max_element(contours.begin(), contours.end(), [](const auto& a, const auto& b) { return a.size() < b.size(); });
	cv::Mat filled   = cv::Mat::zeros(component.size(), CV_8U);
	cv::drawContours(filled, contours, static_cast<int>(std::distance(contours.begin(), outer)), cv::Scalar(255), cv::FILLED);

	metrics.filledArea = cv::countNonZero(filled);
	if (metrics.filledArea == 0) {
		return metrics;
	}
	metrics.fill = static_cast<double>(metrics.filledArea) / static_cast<double>(box.area());

	cv::Mat holes;
	cv::bitwise_and(filled, ~component, holes);

	cv::Mat holeLabels, holeStats, holeCentroids;
	const int holeCount = cv::connectedComponentsWithStats(holes, holeLabels, holeStats, holeCentroids, 8, CV_32S);
	for (int i = 1; i < holeCount; ++i) {
		const int area = holeStats.at<int>(i, cv::CC_STAT_AREA);
		if (area < config.minFeaturePixels) {
			continue;
		}
		metrics.holes.push_back(Hole{
		        cv::Point2d(holeCentroids.at<double>(i, 0), holeCentroids.at<double>(i, 1)),
		        cv::Rect(holeStats.at<int>(i, cv::CC_STAT_LEFT), holeStats.at<int>(i, cv::CC_STAT_TOP), holeStats.at<int>(i, cv::CC_STAT_WIDTH),
		                 holeStats.at<int>(i, cv::CC_STAT_HEIGHT)),
		        area,
		});
	}
	return metrics;
}

static double shapeScore(const BlobMetrics& m, const SkinBlobConfig& config) {
	return clamp01(1.0 - std::abs(m.fill - config.idealFill) / config.fillTolerance);
}

static bool isAspectPlausible(const BlobMetrics& m, const SkinBlobConfig& config) {
	return m.aspect >= config.aspectMin - config.aspectFalloff / 2.0 && m.aspect <= config.aspectMax + config.aspectFalloff / 2.0;
}

static double aspectScore(const BlobMetrics& m, const SkinBlobConfig& config) {
	if (m.aspect < config.aspectMin) {
		return clamp01(1.0 - (config.aspectMin - m.aspect) / config.aspectFalloff);
	}
	if (m.aspect > config.aspectMax) {
		return clamp01(1.0 - (m.aspect - config.aspectMax) / config.aspectFalloff);
	}
	return 1.0;
}

static bool isEyeCandidate(const Hole& hole, const BlobMetrics& m, const SkinBlobConfig& config) {
	const double relativeArea = static_cast<double>(hole.area) / static_cast<double>(m.filledArea);
	if (relativeArea < config.eyeMinFraction || relativeArea > config.eyeMaxFraction) {
		return false;
	}
	if (static_cast<double>(hole.area) / static_cast<double>(hole.box.area()) < config.eyeMinCompactness) {
		return false;
	}

	const double holeAspect = static_cast<double>(hole.box.height) / static_cast<double>(hole.box.width);
	if (holeAspect > EYE_ASPECT_LIMIT || holeAspect < 1.0 / EYE_ASPECT_LIMIT) {
		return false;
	}

	const double band = hole.centre.y / static_cast<double>(m.box.height);
	return band >= config.eyeBandTop && band <= config.eyeBandBottom;
}

static bool hasMouthBelow(const BlobMetrics& m, const EyePair& pair, const SkinBlobConfig& config) {
	const Hole& left     = m.holes[pair.left];
	const Hole& right    = m.holes[pair.right];
	const double spacing = right.centre.x - left.centre.x;
	const double eyeLine = (left.centre.y + right.centre.y) / 2.0;

	for (std::size_t i = 0; i < m.holes.size(); ++i) {
		if (i == pair.left || i == pair.right) {
			continue;
		}

		const Hole& mouth = m.holes[i];
		if (static_cast<double>(mouth.area) / static_cast<double>(m.filledArea) > config.mouthMaxFraction) {
			continue;
		}
		if (mouth.centre.x < left.centre.x || mouth.centre.x > right.centre.x) {
			continue;
		}

		const double drop = mouth.centre.y - eyeLine;
		if (drop >= config.mouthDropMin * spacing && drop <= config.mouthDropMax * spacing) {
			return true;
		}
	}
	return false;
}

//! Greedy left to right pairing. Each eye belongs to at most one face and every pair needs its own mouth.
static std::vector<EyePair> findEyePairs(const BlobMetrics& m, const SkinBlobConfig& config) {
	std::vector<std::size_t> eyes;
	for (std::size_t i = 0; i < m.holes.size(); ++i) {
		if (isEyeCandidate(m.holes[i], m, config)) {
			eyes.push_back(i);
		}
	}
	std::sort(eyes.begin(), eyes.end(), [&m](std::size_t a, std::size_t b) { return m.holes[a].centre.x < m.holes[b].centre.x; });

	std::vector<EyePair> pairs;
	std::vector<bool> used(eyes.size(), false);
	for (std::size_t i = 0; i < eyes.size(); ++i) {
		if (used[i]) {
			continue;
		}
		const Hole& left = m.holes[eyes[i]];

		for (std::size_t j = i + 1; j < eyes.size(); ++j) {
			if (used[j]) {
				continue;
			}
			const Hole& right = m.holes[eyes[j]];

			const double meanWidth  = (left.box.width + right.box.width) / 2.0;
			const double meanHeight = (left.box.height + right.box.height) / 2.0;
			const double spacing    = right.centre.x - left.centre.x;
			if (spacing < config.eyeSpacingMin * meanWidth || spacing > config.eyeSpacingMax * meanWidth) {
				continue;
			}
			if (std::abs(right.centre.y - left.centre.y) > meanHeight / 2.0 + 2.0) {
				continue;
			}
			const double areaRatio = static_cast<double>(std::max(left.area, right.area)) / static_cast<double>(std::min(left.area, right.area));
			if (areaRatio > config.eyeMaxAreaRatio) {
				continue;
			}

			const EyePair pair{eyes[i], eyes[j]};
			if (hasMouthBelow(m, pair, config)) {
				pairs.push_back(pair);
				used[i] = used[j] = true;
				break;
			}
		}
	}
	return pairs;
}

//! Face box implied by an eye pair. Eyes sit at 30% and 70% of the face width and at 3/8 of its height.
static cv::Rect faceBoxOf(const BlobMetrics& m, const EyePair& pair) {
	const Hole& left     = m.holes[pair.left];
	const Hole& right    = m.holes[pair.right];
	const double spacing = right.centre.x - left.centre.x;
	const double width   = spacing / 0.4;
	const double height  = width * 4.0 / 3.0;
	const double centreX = (left.centre.x + right.centre.x) / 2.0;
	const double eyeLine = (left.centre.y + right.centre.y) / 2.0;

	const cv::Rect local(cvRound(centreX - width / 2.0), cvRound(eyeLine - height * 0.375), cvRound(width), cvRound(height));
	return (local + m.box.tl()) & m.box;
}

static float blobConfidence(double shape, double aspect, bool hasFeatures, const SkinBlobConfig& config) {
	const double geometry = clamp01(config.shapeWeight * shape + config.aspectWeight * aspect);
	if (hasFeatures) {
		return static_cast<float>(config.featureBase + (1.0 - config.featureBase) * geometry);
	}
	return static_cast<float>(config.featurelessCeiling * geometry);
}

} // namespace

SkinBlobFaceDetector::SkinBlobFaceDetector(SkinBlobConfig config) : m_config(config) {
}

std::vector<FaceRegion> SkinBlobFaceDetector::detect(const cv::Mat& image, DebugVisualizer* debugger) const {
	if (image.empty() || image.type() != CV_8UC3) {
		return {};
	}

	if (debugger) {
		debugger->beginStage("Skin Blobs");
	}

	cv::Mat mask = buildSkinMask(image, m_config);
	if (debugger)
		debugger->add("Skin Mask", mask);

	if (m_config.openKernel > 1) {
		const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(m_config.openKernel, m_config.openKernel));
		cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel);
		if (debugger)
			debugger->add("Opened", mask);
	}

	cv::Mat labels, stats, centroids;
	const int labelCount = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

	std::vector<FaceRegion> regions;
	for (int label = 1; label < labelCount; ++label) {
		if (stats.at<int>(label, cv::CC_STAT_AREA) < m_config.minBlobPixels) {
			continue;
		}

		const cv::Rect box(stats.at<int>(label, cv::CC_STAT_LEFT), stats.at<int>(label, cv::CC_STAT_TOP), stats.at<int>(label, cv::CC_STAT_WIDTH),
		                   stats.at<int>(label, cv::CC_STAT_HEIGHT));
		const BlobMetrics metrics = measureBlob(labels, label, box, m_config);
		const double shape        = shapeScore(metrics, m_config);
		if (shape <= 0.0 || !isAspectPlausible(metrics, m_config)) {
			continue;
		}
		const double aspect = aspectScore(metrics, m_config);

		const auto pairs = findEyePairs(metrics, m_config);
		if (pairs.empty()) {
			const float confidence = blobConfidence(shape, aspect, false, m_config);
			if (confidence >= m_config.candidateFloor) {
				regions.push_back(FaceRegion{box, confidence});
			}
			continue;
		}

		const float confidence = blobConfidence(shape, aspect, true, m_config);
		if (pairs.size() == 1) {
			regions.push_back(FaceRegion{box, confidence});
			continue;
		}
		// Touching faces merged into one blob.
		for (const auto& pair: pairs) {
			regions.push_back(FaceRegion{faceBoxOf(metrics, pair), confidence});
		}
	}

	// Strongest first. Ties broken by position so the order never depends on label numbering.
	std::sort(regions.begin(), regions.end(), [](const FaceRegion& a, const FaceRegion& b) {
		if (a.confidence != b.confidence) {
			return a.confidence > b.confidence;
		}
		if (a.box.y != b.box.y) {
			return a.box.y < b.box.y;
		}
		return a.box.x < b.box.x;
	});

	if (debugger) {
		std::vector<cv::Rect> boxes;
		std::vector<float> confidences;
		for (const auto& region: regions) {
			boxes.push_back(region.box);
			confidences.push_back(region.confidence);
		}
		debugger->add("Candidates", DebugVisualizer::drawRegions(image, boxes, confidences));
		debugger->endStage();
	}

	return regions;
}

} // namespace whoisit::avatar
