#include "EdgeDetector.hpp"

#include "opencv2/imgproc.hpp"

#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace EyeTrack {

EdgeDetector::EdgeDetector(EngineParameters myParameters) {
	parameters = myParameters;
	if(parameters.resolution.width <= 0 || parameters.resolution.height <= 0) {
		throw invalid_argument("EdgeDetector resolution is nonsense");
	}
	if(parameters.pupilRadius < 1) {
		throw invalid_argument("pupilRadius must be at least one pixel");
	}
	maxRadius = (double)std::min(parameters.resolution.width, parameters.resolution.height) / 2.0;
	if(parameters.skipAutoRadius) {
		radiusEstimate = parameters.pupilRadius;
	} else {
		radiusEstimate = maxRadius / 4.0;
	}
	logger = new Logger("EdgeDetector");
	logger->debug1("EdgeDetector object constructed for %dx%d frames, initial radius %.02lf.", parameters.resolution.width, parameters.resolution.height, radiusEstimate);
}

EdgeDetector::~EdgeDetector() {
	logger->debug1("EdgeDetector object destructing...");
	delete logger;
}

DetectorAlgorithm EdgeDetector::getAlgorithm(void) {
	return DETECTOR_EDGE;
}

void EdgeDetector::updateTuning(const EngineParameters &myParameters) {
	parameters.pupilRadius = myParameters.pupilRadius;
	if(parameters.skipAutoRadius != myParameters.skipAutoRadius) {
		logger->debug2("Automatic radius estimation turned %s.", myParameters.skipAutoRadius ? "off" : "on");
	}
	parameters.skipAutoRadius = myParameters.skipAutoRadius;
	if(parameters.skipAutoRadius) {
		radiusEstimate = parameters.pupilRadius;
	}
}

double EdgeDetector::getRadiusEstimate(void) {
	return radiusEstimate;
}

DetectorResult EdgeDetector::run(const Mat &gray) {
	DetectorResult result;
	Mat blurred, edges;
	GaussianBlur(gray, blurred, Size(5, 5), 0);
	Canny(blurred, edges, 40, 80);

	vector<vector<Point>> contours;
	findContours(edges.clone(), contours, RETR_LIST, CHAIN_APPROX_NONE);

	cvtColor(gray, result.diagnosticFrame, COLOR_GRAY2BGR);

	RotatedRect best;
	double bestScore = -1.0;
	for(auto &contour : contours) {
		if(contour.size() < 5) {
			continue;
		}
		RotatedRect candidate = fitEllipse(contour);
		double radius = (candidate.size.width + candidate.size.height) / 4.0;
		if(radius < EDGEDETECTOR_MIN_RADIUS || radius > maxRadius) {
			continue;
		}
		double ratio = std::min(candidate.size.width, candidate.size.height) / std::max(candidate.size.width, candidate.size.height);
		if(ratio < 0.5) {
			continue;
		}
		double score = std::fabs(radius - radiusEstimate);
		if(bestScore < 0.0 || score < bestScore) {
			bestScore = score;
			best = candidate;
		}
	}

	if(bestScore < 0.0) {
		logger->debug3("No ellipse candidates among %lu contours.", (unsigned long)contours.size());
		return result;
	}

	if(!parameters.skipAutoRadius) {
		double radius = (best.size.width + best.size.height) / 4.0;
		radiusEstimate = (1.0 - EDGEDETECTOR_RADIUS_ADAPT) * radiusEstimate + EDGEDETECTOR_RADIUS_ADAPT * radius;
	}
	result.center = Point2d(best.center.x, best.center.y);
	result.found = true;
	ellipse(result.diagnosticFrame, best, Scalar(0, 255, 0), 1);
	Utilities::drawX(result.diagnosticFrame, result.center, Scalar(0, 0, 255), 6);
	return result;
}

} //namespace EyeTrack
