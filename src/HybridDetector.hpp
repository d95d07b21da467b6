#pragma once

#include "DetectorEngine.hpp"
#include "Logger.hpp"

#include "opencv2/core.hpp"

using namespace std;

namespace EyeTrack {

// Coarse dark-region search followed by a fine ellipse fit inside the
// winning window. Hands back the window as a replacement gray frame.
class HybridDetector: public DetectorEngine {
public:
	HybridDetector(EngineParameters myParameters);
	~HybridDetector();
	DetectorAlgorithm getAlgorithm(void);
	DetectorResult run(const cv::Mat &gray);
	void updateTuning(const EngineParameters &myParameters);
	cv::Rect getLastSearchWindow(void);
private:
	cv::Rect coarseSearch(const cv::Mat &gray);
	int getSearchRadius(void);

	EngineParameters parameters;
	double radiusEstimate;
	cv::Rect lastSearchWindow;

	Logger *logger;
};

}; //namespace EyeTrack
