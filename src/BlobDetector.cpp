#include "BlobDetector.hpp"

#include "opencv2/imgproc.hpp"

#include <vector>

using namespace std;
using namespace cv;

namespace EyeTrack {

BlobDetector::BlobDetector(EngineParameters myParameters) {
	parameters = myParameters;
	if(parameters.resolution.width <= 0 || parameters.resolution.height <= 0) {
		throw invalid_argument("BlobDetector resolution is nonsense");
	}
	structuringElement = getStructuringElement(MORPH_ELLIPSE, Size(3, 3));
	logger = new Logger("BlobDetector");
	logger->debug1("BlobDetector object constructed for %dx%d frames.", parameters.resolution.width, parameters.resolution.height);
}

BlobDetector::~BlobDetector() {
	logger->debug1("BlobDetector object destructing...");
	delete logger;
}

DetectorAlgorithm BlobDetector::getAlgorithm(void) {
	return DETECTOR_BLOB;
}

void BlobDetector::updateTuning(const EngineParameters &myParameters) {
	parameters.blobThreshold = myParameters.blobThreshold;
	parameters.blobMinimumArea = myParameters.blobMinimumArea;
	parameters.blobMaximumArea = myParameters.blobMaximumArea;
}

DetectorResult BlobDetector::run(const Mat &gray) {
	DetectorResult result;
	Mat thresholded;
	threshold(gray, thresholded, parameters.blobThreshold, 255, THRESH_BINARY_INV);
	morphologyEx(thresholded, thresholded, MORPH_OPEN, structuringElement);
	morphologyEx(thresholded, thresholded, MORPH_CLOSE, structuringElement);

	//findContours() scribbles on its input.
	Mat searchFrame = thresholded.clone();
	vector<vector<Point>> contours;
	findContours(searchFrame, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

	double bestArea = -1.0;
	int bestIndex = -1;
	for(size_t i = 0; i < contours.size(); i++) {
		double area = contourArea(contours[i]);
		if(area < parameters.blobMinimumArea || area > parameters.blobMaximumArea) {
			continue;
		}
		if(area > bestArea) {
			bestArea = area;
			bestIndex = (int)i;
		}
	}

	cvtColor(thresholded, result.diagnosticFrame, COLOR_GRAY2BGR);
	if(bestIndex < 0) {
		logger->debug3("No blob within the area limits (%lu candidates).", (unsigned long)contours.size());
		return result;
	}

	Moments m = moments(contours[bestIndex]);
	if(m.m00 <= 0.0) {
		return result;
	}
	result.center = Point2d(m.m10 / m.m00, m.m01 / m.m00);
	result.found = true;
	drawContours(result.diagnosticFrame, contours, bestIndex, Scalar(255, 0, 0), 1);
	Utilities::drawX(result.diagnosticFrame, result.center, Scalar(0, 0, 255), 6);
	logger->debug4("Blob area %.01lf at <%.02lf, %.02lf>", bestArea, result.center.x, result.center.y);
	return result;
}

} //namespace EyeTrack
