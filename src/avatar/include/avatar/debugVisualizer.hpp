#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <string>
#include <vector>

namespace whoisit::avatar {

//! Single intermediate image of the qualification pipeline.
struct DebugStep {
	std::string name; //!< Short label drawn under the tile.
	cv::Mat image;    //!< Deep copy of the image at that step.
};

//! Group of steps belonging to one pipeline stage (decode, skin mask, verdict, ...).
struct DebugStage {
	std::string name;
	std::vector<DebugStep> steps{};
};

//! Optional sink passed to the detectors and the qualifier to collect intermediate images.
//! Not thread-safe. Use one instance per qualification call.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Start a new stage. Ends the active stage first.
	void add(std::string name, const cv::Mat& img); //!< Add a step to the active stage. Ignored without an active stage.
	void endStage();

	//! Copy of `image` with the given face boxes and their confidences drawn on top.
	static cv::Mat drawRegions(const cv::Mat& image, const std::vector<cv::Rect>& boxes, const std::vector<float>& confidences);

	cv::Mat buildMosaic(); //!< One row per stage. Ends the active stage. Empty if nothing was collected.

	const std::vector<DebugStage>& stages() const {
		return m_stages;
	}
	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{};
};

} // namespace whoisit::avatar
