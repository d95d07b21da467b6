#include "GazeCalibrator.hpp"

#include <algorithm>

using namespace std;
using namespace cv;

namespace EyeTrack {

GazeCalibrator::GazeCalibrator(string myName) {
	name = myName;
	logger = new Logger("GazeCalibrator<" + name + ">");
	haveBounds = false;
	xMin = xMax = yMin = yMax = 0.0;
	haveCenter = false;
	center = Point2d(0.0, 0.0);
	recenterRequested = false;
	calibrationFramesRemaining = 0;
	logger->debug1("GazeCalibrator object constructed and ready to go!");
}

GazeCalibrator::~GazeCalibrator() {
	logger->debug1("GazeCalibrator object destructing...");
	delete logger;
}

void GazeCalibrator::restartCalibration(int frames) {
	if(frames < 0) {
		throw invalid_argument("calibration frames cannot be negative");
	}
	haveBounds = false;
	xMin = xMax = yMin = yMax = 0.0;
	haveCenter = false;
	recenterRequested = false;
	calibrationFramesRemaining = frames;
	logger->info("Calibration restarted. Look around the edges of your view for the next %d frames, then straight ahead.", frames);
}

void GazeCalibrator::recenter(void) {
	recenterRequested = true;
}

double GazeCalibrator::normalizeAxis(double value, double minimum, double maximum, double center, bool haveCenter) {
	double result;
	if(haveCenter) {
		double span = value >= center ? maximum - center : center - minimum;
		if(span <= 0.0) {
			return 0.0;
		}
		result = (value - center) / span;
	} else {
		double span = maximum - minimum;
		if(span <= 0.0) {
			return 0.0;
		}
		result = 2.0 * (value - minimum) / span - 1.0;
	}
	return std::max(-1.0, std::min(1.0, result));
}

Point2d GazeCalibrator::normalize(Point2d raw) {
	if(!haveBounds) {
		xMin = xMax = raw.x;
		yMin = yMax = raw.y;
		haveBounds = true;
	} else {
		xMin = std::min(xMin, raw.x);
		xMax = std::max(xMax, raw.x);
		yMin = std::min(yMin, raw.y);
		yMax = std::max(yMax, raw.y);
	}

	if(calibrationFramesRemaining > 0) {
		calibrationFramesRemaining--;
		if(calibrationFramesRemaining == 0) {
			logger->info("Calibration window finished. Bounds x <%.02lf, %.02lf> y <%.02lf, %.02lf>", xMin, xMax, yMin, yMax);
			recenterRequested = true;
		}
	}

	if(recenterRequested) {
		center = raw;
		haveCenter = true;
		recenterRequested = false;
		logger->debug1("Recentered on <%.02lf, %.02lf>", center.x, center.y);
	}

	return Point2d(
		normalizeAxis(raw.x, xMin, xMax, center.x, haveCenter),
		normalizeAxis(raw.y, yMin, yMax, center.y, haveCenter));
}

bool GazeCalibrator::getIsCalibrating(void) {
	return calibrationFramesRemaining > 0;
}

bool GazeCalibrator::getHasCenter(void) {
	return haveCenter;
}

Point2d GazeCalibrator::getCenter(void) {
	return center;
}

Rect2d GazeCalibrator::getBounds(void) {
	return Rect2d(xMin, yMin, xMax - xMin, yMax - yMin);
}

bool GazeCalibrator::getHasBounds(void) {
	return haveBounds;
}

} //namespace EyeTrack
