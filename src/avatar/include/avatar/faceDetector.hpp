#pragma once

#include "avatar/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace whoisit::avatar {

//! One candidate face in image coordinates.
struct FaceRegion {
	cv::Rect box;     //!< Bounding box in the coordinates of the image passed to detect().
	float confidence; //!< Detector score mapped to [0,1].
};

//! Face detection backend used by the ImageQualifier.
//! Implementations must be safe to call concurrently from several threads on the same instance.
class FaceDetector {
public:
	virtual ~FaceDetector() = default;

	//! Find face candidates in a BGR image.
	//! \param [in]     image    8-bit, 3 channel BGR image. Never empty.
	//! \param [in,out] debugger Optional debug visualizer for intermediate images.
	//! \return         All candidates the backend reports, including weak ones. The qualifier applies its own threshold.
	virtual std::vector<FaceRegion> detect(const cv::Mat& image, DebugVisualizer* debugger) const = 0;

	virtual std::string name() const = 0;
};

//! Parameters of the model free skin blob detector.
struct SkinBlobConfig {
	// YCrCb skin box. Works across a wide range of skin tones under neutral light.
	int crMin{133};
	int crMax{173};
	int cbMin{77};
	int cbMax{127};

	int openKernel{3};            //!< Opening kernel size (px). Removes speckle without closing the eye/mouth holes.
	int minBlobPixels{64};        //!< Smaller blobs are ignored outright.
	float candidateFloor{0.2f};   //!< Blobs scoring below this are not reported at all.

	// Shape gates. A blob outside either range is not reported.
	double idealFill{0.785};      //!< Area of an ellipse relative to its bounding box (pi / 4).
	double fillTolerance{0.18};   //!< Fill deviation at which the shape score reaches zero. Rectangles (fill 1) fail.
	double aspectMin{0.9};        //!< Height / width range that scores fully.
	double aspectMax{1.7};
	double aspectFalloff{0.7};    //!< Distance outside the range at which the aspect score reaches zero.

	// Facial features are non-skin holes inside the blob outline.
	int minFeaturePixels{6};          //!< Smaller holes are noise.
	double eyeMinFraction{0.002};     //!< Eye hole area relative to the filled blob area.
	double eyeMaxFraction{0.06};
	double eyeMinCompactness{0.5};    //!< Hole area / hole bounding box area. Letter strokes fall below.
	double eyeBandTop{0.15};          //!< Vertical band of the blob box (0 top, 1 bottom) eye centres must lie in.
	double eyeBandBottom{0.6};
	double eyeSpacingMin{1.5};        //!< Horizontal eye distance in mean eye widths.
	double eyeSpacingMax{6.0};
	double eyeMaxAreaRatio{3.0};      //!< Larger / smaller eye area.
	double mouthDropMin{0.5};         //!< Mouth centre below the eye line, in eye distances.
	double mouthDropMax{3.0};
	double mouthMaxFraction{0.15};    //!< Mouth hole area relative to the filled blob area.

	float featureBase{0.55f};         //!< Confidence floor of a blob with eyes and mouth.
	float featurelessCeiling{0.4f};   //!< Confidence ceiling of a plausible blob without a complete set of features.
	float shapeWeight{0.6f};
	float aspectWeight{0.4f};
};

//! Detects faces as skin coloured, roughly elliptic blobs with two eye holes side by side and a mouth hole below.
//! Needs no model file. Every eye pair with a mouth is one face, so touching faces that merge into one blob still
//! count separately. A plausible blob without features is reported as a weak candidate.
class SkinBlobFaceDetector final : public FaceDetector {
public:
	explicit SkinBlobFaceDetector(SkinBlobConfig config = SkinBlobConfig{});

	std::vector<FaceRegion> detect(const cv::Mat& image, DebugVisualizer* debugger) const override;
	std::string name() const override {
		return "skin";
	}

	const SkinBlobConfig& config() const {
		return m_config;
	}

private:
	SkinBlobConfig m_config;
};

//! Which detector createFaceDetector builds.
enum class DetectorBackend { SkinBlob, Cascade, YuNet };

struct DetectorConfig {
	DetectorBackend backend{DetectorBackend::SkinBlob};
	std::string modelPath{};        //!< Haar cascade XML or YuNet ONNX file. Unused by SkinBlob.
	SkinBlobConfig skin{};
	double cascadeScaleFactor{1.1};
	int cascadeMinNeighbors{3};
	int cascadeMinSize{24};         //!< Smallest face side (px) the cascade looks for.
	double cascadeWeightMidpoint{2.0}; //!< Level weight mapped to confidence 0.5.
	double cascadeWeightSlope{1.0};
	float yunetScoreThreshold{0.1f}; //!< Keep weak YuNet faces so the qualifier can report LowConfidence.
	float yunetNmsThreshold{0.3f};
	int yunetTopK{50};
};

//! Map an unbounded cascade level weight to [0,1] with a logistic curve centred on `cascadeWeightMidpoint`.
float cascadeConfidence(double levelWeight, const DetectorConfig& config);

//! Convert cv::FaceDetectorYN output to regions.
//! \param [in] detections One row per face: x, y, w, h, 10 landmark values, score.
//! \param [in] imageSize  Boxes are clipped to this size. Boxes entirely outside are dropped.
//! \return     Regions with scores clamped to [0,1], strongest first.
std::vector<FaceRegion> parseYuNetDetections(const cv::Mat& detections, cv::Size imageSize);

//! Build the configured detector.
//! \return Null if a model backed detector cannot load its model. The reason is logged.
std::unique_ptr<FaceDetector> createFaceDetector(const DetectorConfig& config);

//! Parse "skin", "cascade" or "yunet".
bool parseDetectorBackend(const std::string& name, DetectorBackend& out);

} // namespace whoisit::avatar
