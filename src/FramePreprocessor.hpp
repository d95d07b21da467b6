#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "opencv2/core.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

#define FRAMEPREPROCESSOR_BORDER_GRAY 64

class PreprocessedFrame {
public:
	cv::Mat cropped; //Cropped, unrotated BGR. Becomes the fallback once accepted.
	cv::Mat color; //Cropped and rotated BGR.
	cv::Mat gray; //Working copy, detectors may replace it.
	cv::Mat cleanGray; //Untouched copy for blink intensity.
	bool usedFallback;
};

class FramePreprocessor {
public:
	FramePreprocessor(string myName);
	~FramePreprocessor();
	bool process(const cv::Mat &frame, cv::Rect roi, double rotationAngle, PreprocessedFrame *result);
	void acceptFrame(const PreprocessedFrame &accepted, double rotationAngle);
	bool hasAcceptedFrame(void);
	double getLastRotationAngle(void);
	void reset(void);
	static bool cropFrame(const cv::Mat &frame, cv::Rect roi, cv::Mat *cropped);
	static cv::Mat rotateFrame(const cv::Mat &frame, double rotationAngle);
private:
	static bool normalizeFrame(const cv::Mat &frame, cv::Mat *normalized);

	string name;
	cv::Mat lastAccepted;
	double lastRotationAngle;

	Logger *logger;
};

}; //namespace EyeTrack
