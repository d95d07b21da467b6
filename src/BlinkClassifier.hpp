#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "opencv2/core.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

// Judges eye closure from the brightness around the reported pupil. A closed
// lid is brighter than an open pupil, so the running intensity extrema give
// the scale and anything near the bright end counts as a blink.
class BlinkClassifier {
public:
	BlinkClassifier(string myName, double myThreshold, int myWarmupFrames);
	~BlinkClassifier();
	bool classify(const cv::Mat &cleanGray, cv::Point2d center);
	double measureIntensity(const cv::Mat &cleanGray, cv::Point2d center);
	void reset(void);
	double getMinimumIntensity(void);
	double getMaximumIntensity(void);
	int getFramesSeen(void);
private:
	string name;
	double threshold;
	int warmupFrames;

	int framesSeen;
	double minimumIntensity, maximumIntensity;
	bool lastBlink;

	Logger *logger;
};

}; //namespace EyeTrack
