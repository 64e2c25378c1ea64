#include "avatar/debugVisualizer.hpp"

#include <algorithm>
#include <cstdio>

#include <opencv2/imgproc.hpp>

namespace whoisit::avatar {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}
	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage || img.empty()) {
		return;
	}
	m_currentStage.steps.push_back(DebugStep{std::move(name), img.clone()});
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::drawRegions(const cv::Mat& image, const std::vector<cv::Rect>& boxes, const std::vector<float>& confidences) {
	cv::Mat canvas = toBgr8U(image);
	for (std::size_t i = 0; i < boxes.size(); ++i) {
		const float confidence = i < confidences.size() ? confidences[i] : 0.0f;
		const cv::Scalar colour = confidence >= 0.5f ? cv::Scalar(0, 220, 0) : cv::Scalar(0, 140, 255);
		cv::rectangle(canvas, boxes[i], colour, 2);

		char label[16];
		std::snprintf(label, sizeof(label), "%.2f", static_cast<double>(confidence));
		const cv::Point origin(boxes[i].x, std::max(12, boxes[i].y - 4));
		cv::putText(canvas, label, origin, cv::FONT_HERSHEY_SIMPLEX, 0.45, colour, 1, cv::LINE_AA);
	}
	return canvas;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_H  = 240;
	static constexpr int LABEL_H = 22;
	static constexpr int PAD     = 4;

	endStage();
	if (m_stages.empty()) {
		return {};
	}

	// Tiles keep their aspect ratio at a fixed height. Rows are left aligned.
	std::vector<std::vector<cv::Mat>> rows;
	int mosaicW = 0;
	for (const auto& stage: m_stages) {
		std::vector<cv::Mat> tiles;
		int rowW = PAD;
		for (const auto& step: stage.steps) {
			const cv::Mat bgr  = toBgr8U(step.image);
			const double scale = static_cast<double>(TILE_H) / static_cast<double>(std::max(1, bgr.rows));
			const int tileW    = std::max(1, static_cast<int>(bgr.cols * scale));

			cv::Mat tile(TILE_H + LABEL_H, tileW, CV_8UC3, cv::Scalar(15, 15, 15));
			cv::resize(bgr, tile(cv::Rect(0, 0, tileW, TILE_H)), cv::Size(tileW, TILE_H), 0.0, 0.0, cv::INTER_AREA);
			cv::putText(tile, stage.name + ": " + step.name, cv::Point(4, TILE_H + 16), cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(235, 235, 235), 1,
			            cv::LINE_AA);

			rowW += tileW + PAD;
			tiles.push_back(std::move(tile));
		}
		if (!tiles.empty()) {
			mosaicW = std::max(mosaicW, rowW);
			rows.push_back(std::move(tiles));
		}
	}
	if (rows.empty()) {
		return {};
	}

	const int rowH    = TILE_H + LABEL_H + PAD;
	const int mosaicH = PAD + static_cast<int>(rows.size()) * rowH;
	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, cv::Scalar(30, 30, 30));

	int y = PAD;
	for (const auto& tiles: rows) {
		int x = PAD;
		for (const auto& tile: tiles) {
			tile.copyTo(mosaic(cv::Rect(x, y, tile.cols, tile.rows)));
			x += tile.cols + PAD;
		}
		y += rowH;
	}
	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out8;
	if (in.depth() == CV_8U) {
		out8 = in;
	} else {
		cv::normalize(in, out8, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat bgr;
	switch (out8.channels()) {
	case 1:
		cv::cvtColor(out8, bgr, cv::COLOR_GRAY2BGR);
		break;
	case 4:
		cv::cvtColor(out8, bgr, cv::COLOR_BGRA2BGR);
		break;
	default:
		bgr = out8.clone();
		break;
	}
	return bgr;
}

} // namespace whoisit::avatar
