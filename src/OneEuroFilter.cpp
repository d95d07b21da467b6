#include "OneEuroFilter.hpp"

#define _USE_MATH_DEFINES
#include <cmath>

using namespace std;
using namespace cv;

namespace EyeTrack {

OneEuroFilter::OneEuroFilter(double myMinCutoff, double mySpeedCoefficient, double myDerivativeCutoff) {
	minCutoff = myMinCutoff;
	if(!std::isfinite(minCutoff) || minCutoff <= 0.0) {
		throw invalid_argument("minCutoff must be greater than zero");
	}
	speedCoefficient = mySpeedCoefficient;
	if(!std::isfinite(speedCoefficient) || speedCoefficient < 0.0) {
		throw invalid_argument("speedCoefficient cannot be negative");
	}
	derivativeCutoff = myDerivativeCutoff;
	if(!std::isfinite(derivativeCutoff) || derivativeCutoff <= 0.0) {
		throw invalid_argument("derivativeCutoff must be greater than zero");
	}
	reset();
}

// Builds a filter from whatever the user typed in. Anything unusable gets the
// stock tuning instead, with a warning.
OneEuroFilter *OneEuroFilter::fromSettings(json minCutoff, json speedCoefficient, Logger *logger) {
	double myMinCutoff, mySpeedCoefficient;
	bool valid = Utilities::parseDouble(minCutoff, &myMinCutoff) && Utilities::parseDouble(speedCoefficient, &mySpeedCoefficient);
	if(valid && (myMinCutoff <= 0.0 || mySpeedCoefficient < 0.0)) {
		valid = false;
	}
	if(!valid) {
		if(logger != NULL) {
			logger->warning("Smoothing parameters must be legal numbers (got minCutoff %s, speedCoefficient %s). Using %.04lf and %.02lf.", minCutoff.dump().c_str(), speedCoefficient.dump().c_str(), ONEEURO_DEFAULT_MIN_CUTOFF, ONEEURO_DEFAULT_SPEED_COEFFICIENT);
		}
		myMinCutoff = ONEEURO_DEFAULT_MIN_CUTOFF;
		mySpeedCoefficient = ONEEURO_DEFAULT_SPEED_COEFFICIENT;
	}
	return new OneEuroFilter(myMinCutoff, mySpeedCoefficient);
}

void OneEuroFilter::reset(void) {
	primed = false;
	previousValue = Point2d(0.0, 0.0);
	previousDerivative = Point2d(0.0, 0.0);
}

double OneEuroFilter::getMinCutoff(void) {
	return minCutoff;
}

double OneEuroFilter::getSpeedCoefficient(void) {
	return speedCoefficient;
}

double OneEuroFilter::smoothingFactor(double cutoff, double elapsedSeconds) {
	double tau = 1.0 / (2.0 * M_PI * cutoff);
	return 1.0 / (1.0 + tau / elapsedSeconds);
}

Point2d OneEuroFilter::filter(Point2d value, double elapsedSeconds) {
	if(!primed || elapsedSeconds <= 0.0) {
		if(!primed) {
			previousValue = value;
			previousDerivative = Point2d(0.0, 0.0);
			primed = true;
		}
		return previousValue;
	}

	Point2d derivative = (value - previousValue) * (1.0 / elapsedSeconds);
	double alphaDerivative = smoothingFactor(derivativeCutoff, elapsedSeconds);
	Point2d derivativeHat = previousDerivative + (derivative - previousDerivative) * alphaDerivative;

	double speed = std::sqrt(derivativeHat.x * derivativeHat.x + derivativeHat.y * derivativeHat.y);
	double cutoff = minCutoff + speedCoefficient * speed;
	double alpha = smoothingFactor(cutoff, elapsedSeconds);
	Point2d valueHat = previousValue + (value - previousValue) * alpha;

	previousValue = valueHat;
	previousDerivative = derivativeHat;
	return valueHat;
}

} //namespace EyeTrack
