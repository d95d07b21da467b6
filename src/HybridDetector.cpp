#include "HybridDetector.hpp"

#include "opencv2/imgproc.hpp"

#define _USE_MATH_DEFINES
#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace EyeTrack {

HybridDetector::HybridDetector(EngineParameters myParameters) {
	parameters = myParameters;
	if(parameters.resolution.width <= 0 || parameters.resolution.height <= 0) {
		throw invalid_argument("HybridDetector resolution is nonsense");
	}
	if(parameters.pupilRadius < 1) {
		throw invalid_argument("pupilRadius must be at least one pixel");
	}
	if(parameters.skipAutoRadius) {
		radiusEstimate = parameters.pupilRadius;
	} else {
		radiusEstimate = (double)std::min(parameters.resolution.width, parameters.resolution.height) / 8.0;
	}
	logger = new Logger("HybridDetector");
	logger->debug1("HybridDetector object constructed for %dx%d frames, initial radius %.02lf.", parameters.resolution.width, parameters.resolution.height, radiusEstimate);
}

HybridDetector::~HybridDetector() {
	logger->debug1("HybridDetector object destructing...");
	delete logger;
}

DetectorAlgorithm HybridDetector::getAlgorithm(void) {
	return DETECTOR_HYBRID;
}

void HybridDetector::updateTuning(const EngineParameters &myParameters) {
	parameters.pupilRadius = myParameters.pupilRadius;
	parameters.skipAutoRadius = myParameters.skipAutoRadius;
	if(parameters.skipAutoRadius) {
		radiusEstimate = parameters.pupilRadius;
	}
}

Rect HybridDetector::getLastSearchWindow(void) {
	return lastSearchWindow;
}

int HybridDetector::getSearchRadius(void) {
	int radius = (int)std::lround(radiusEstimate);
	int limit = std::min(parameters.resolution.width, parameters.resolution.height) / 4;
	if(radius > limit) {
		radius = limit;
	}
	if(radius < 2) {
		radius = 2;
	}
	return radius;
}

// Slides a square over the integral image and keeps the position where the
// inner box is darkest relative to its surround.
Rect HybridDetector::coarseSearch(const Mat &gray) {
	Mat integralImage;
	integral(gray, integralImage, CV_64F);
	int r = getSearchRadius();
	int inner = r * 2;
	int step = std::max(1, r / 2);
	Rect bounds(0, 0, gray.cols, gray.rows);

	auto boxSum = [&](Rect box) {
		return integralImage.at<double>(box.y, box.x)
			+ integralImage.at<double>(box.y + box.height, box.x + box.width)
			- integralImage.at<double>(box.y, box.x + box.width)
			- integralImage.at<double>(box.y + box.height, box.x);
	};

	double bestResponse = 0.0;
	Rect bestBox;
	bool haveBest = false;
	for(int y = 0; y + inner <= gray.rows; y += step) {
		for(int x = 0; x + inner <= gray.cols; x += step) {
			Rect innerBox(x, y, inner, inner);
			Rect outerBox = Rect(x - r, y - r, inner + 2 * r, inner + 2 * r) & bounds;
			double innerArea = innerBox.area();
			double outerArea = outerBox.area() - innerArea;
			if(outerArea <= 0.0) {
				continue;
			}
			double innerSum = boxSum(innerBox);
			double surroundMean = (boxSum(outerBox) - innerSum) / outerArea;
			double response = (innerSum / innerArea) - surroundMean;
			if(!haveBest || response < bestResponse) {
				bestResponse = response;
				bestBox = innerBox;
				haveBest = true;
			}
		}
	}
	if(!haveBest) {
		return bounds;
	}
	Rect window(bestBox.x - r, bestBox.y - r, bestBox.width + 2 * r, bestBox.height + 2 * r);
	return window & bounds;
}

DetectorResult HybridDetector::run(const Mat &gray) {
	DetectorResult result;
	lastSearchWindow = coarseSearch(gray);
	Mat crop = gray(lastSearchWindow).clone();
	result.replacementGray = crop;

	Mat thresholded;
	threshold(crop, thresholded, 0, 255, THRESH_BINARY_INV | THRESH_OTSU);
	cvtColor(crop, result.diagnosticFrame, COLOR_GRAY2BGR);

	vector<vector<Point>> contours;
	findContours(thresholded.clone(), contours, RETR_EXTERNAL, CHAIN_APPROX_NONE);
	int bestIndex = -1;
	double bestArea = 0.0;
	for(size_t i = 0; i < contours.size(); i++) {
		double area = contourArea(contours[i]);
		if(area > bestArea) {
			bestArea = area;
			bestIndex = (int)i;
		}
	}
	if(bestIndex < 0) {
		logger->debug3("Nothing dark enough inside the search window.");
		return result;
	}

	Point2d localCenter;
	double radius;
	if(contours[bestIndex].size() >= 5) {
		RotatedRect fitted = fitEllipse(contours[bestIndex]);
		localCenter = Point2d(fitted.center.x, fitted.center.y);
		radius = (fitted.size.width + fitted.size.height) / 4.0;
		ellipse(result.diagnosticFrame, fitted, Scalar(0, 255, 0), 1);
	} else {
		Moments m = moments(contours[bestIndex]);
		if(m.m00 <= 0.0) {
			return result;
		}
		localCenter = Point2d(m.m10 / m.m00, m.m01 / m.m00);
		radius = std::sqrt(bestArea / M_PI);
	}
	if(!parameters.skipAutoRadius && radius > 0.0) {
		radiusEstimate = 0.8 * radiusEstimate + 0.2 * radius;
	}
	Utilities::drawX(result.diagnosticFrame, localCenter, Scalar(0, 0, 255), 4);

	result.center = localCenter + Point2d(lastSearchWindow.tl());
	result.found = true;
	return result;
}

} //namespace EyeTrack
