#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "opencv2/core.hpp"

using namespace std;

namespace EyeTrack {

#define ONEEURO_DEFAULT_MIN_CUTOFF 0.0004
#define ONEEURO_DEFAULT_SPEED_COEFFICIENT 0.9
#define ONEEURO_DEFAULT_DERIVATIVE_CUTOFF 1.0

// One Euro low-pass filter (Casiez et al.) over a 2D point. The cutoff rises
// with speed, trading jitter suppression for latency only while moving.
class OneEuroFilter {
public:
	OneEuroFilter(double myMinCutoff, double mySpeedCoefficient, double myDerivativeCutoff = ONEEURO_DEFAULT_DERIVATIVE_CUTOFF);
	static OneEuroFilter *fromSettings(json minCutoff, json speedCoefficient, Logger *logger);
	cv::Point2d filter(cv::Point2d value, double elapsedSeconds);
	void reset(void);
	double getMinCutoff(void);
	double getSpeedCoefficient(void);
private:
	static double smoothingFactor(double cutoff, double elapsedSeconds);

	double minCutoff, speedCoefficient, derivativeCutoff;
	bool primed;
	cv::Point2d previousValue, previousDerivative;
};

}; //namespace EyeTrack
