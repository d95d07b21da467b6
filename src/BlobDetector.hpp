#pragma once

#include "DetectorEngine.hpp"
#include "Logger.hpp"

#include "opencv2/core.hpp"

using namespace std;

namespace EyeTrack {

class BlobDetector: public DetectorEngine {
public:
	BlobDetector(EngineParameters myParameters);
	~BlobDetector();
	DetectorAlgorithm getAlgorithm(void);
	DetectorResult run(const cv::Mat &gray);
	void updateTuning(const EngineParameters &myParameters);
private:
	EngineParameters parameters;
	cv::Mat structuringElement;

	Logger *logger;
};

}; //namespace EyeTrack
