#pragma once

#include "EyeSettings.hpp"
#include "Logger.hpp"
#include "Utilities.hpp"

#include "opencv2/core.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

class DetectorResult {
public:
	DetectorResult(void);
	bool isValidSample(void) const;

	bool found;
	cv::Point2d center; //In the coordinates of the gray frame passed to run().
	cv::Mat diagnosticFrame;
	cv::Mat replacementGray; //Optional. When set, diagnosticFrame matches its size.
};

enum DetectorOutcome: unsigned int {
	DETECTOR_OUTCOME_SUCCESS,
	DETECTOR_OUTCOME_FAILURE
};

// Everything an engine may need from the settings. The resolution is the
// only structural parameter; engines are rebuilt when it changes. The rest
// is pushed into a live engine before every run.
class EngineParameters {
public:
	EngineParameters(void);
	static EngineParameters fromSettings(const EyeSettings &settings, cv::Size resolution);

	cv::Size resolution;
	double focalLength;
	bool skipAutoRadius;
	int pupilRadius;
	int blobThreshold;
	double blobMinimumArea, blobMaximumArea;
};

class DetectorEngine {
public:
	virtual ~DetectorEngine() { };
	virtual DetectorAlgorithm getAlgorithm(void) = 0;
	virtual DetectorResult run(const cv::Mat &gray) = 0;
	virtual void updateTuning(const EngineParameters &parameters) { };
};

}; //namespace EyeTrack
