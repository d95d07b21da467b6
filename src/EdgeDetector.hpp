#pragma once

#include "DetectorEngine.hpp"
#include "Logger.hpp"

#include "opencv2/core.hpp"

using namespace std;

namespace EyeTrack {

#define EDGEDETECTOR_MIN_RADIUS 3.0
#define EDGEDETECTOR_RADIUS_ADAPT 0.2

// Canny edges plus ellipse fitting. Keeps a running pupil radius estimate,
// which is why it has to be rebuilt when the frame size changes.
class EdgeDetector: public DetectorEngine {
public:
	EdgeDetector(EngineParameters myParameters);
	~EdgeDetector();
	DetectorAlgorithm getAlgorithm(void);
	DetectorResult run(const cv::Mat &gray);
	void updateTuning(const EngineParameters &myParameters);
	double getRadiusEstimate(void);
private:
	EngineParameters parameters;
	double radiusEstimate;
	double maxRadius;

	Logger *logger;
};

}; //namespace EyeTrack
