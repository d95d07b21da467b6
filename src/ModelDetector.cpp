#include "ModelDetector.hpp"

#include "opencv2/imgproc.hpp"

#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace EyeTrack {

ModelDetector::ModelDetector(EngineParameters myParameters) {
	parameters = myParameters;
	if(parameters.resolution.width <= 0 || parameters.resolution.height <= 0) {
		throw invalid_argument("ModelDetector resolution is nonsense");
	}
	if(parameters.focalLength <= 0.0) {
		throw invalid_argument("focalLength must be greater than zero");
	}
	logger = new Logger("ModelDetector");
	resetModel();
	logger->debug1("ModelDetector object constructed for %dx%d frames, focal length %.02lf.", parameters.resolution.width, parameters.resolution.height, parameters.focalLength);
}

ModelDetector::~ModelDetector() {
	logger->debug1("ModelDetector object destructing...");
	delete logger;
}

DetectorAlgorithm ModelDetector::getAlgorithm(void) {
	return DETECTOR_MODEL;
}

void ModelDetector::updateTuning(const EngineParameters &myParameters) {
	if(myParameters.focalLength > 0.0 && myParameters.focalLength != parameters.focalLength) {
		logger->info("Focal length changed from %.02lf to %.02lf. Starting the eye model over.", parameters.focalLength, myParameters.focalLength);
		parameters.focalLength = myParameters.focalLength;
		resetModel();
	}
}

// Until enough observations arrive the sphere is assumed to sit in the middle
// of the frame, with an apparent size that scales with the focal length.
void ModelDetector::resetModel(void) {
	observations.clear();
	modelIsReady = false;
	sphereCenter = Point2d(parameters.resolution.width / 2.0, parameters.resolution.height / 2.0);
	double halfFrame = std::min(parameters.resolution.width, parameters.resolution.height) / 2.0;
	sphereRadius = halfFrame * std::min(1.0, parameters.focalLength / MODELDETECTOR_REFERENCE_FOCAL_LENGTH);
}

bool ModelDetector::getModelIsReady(void) {
	return modelIsReady;
}

Point2d ModelDetector::getSphereCenter(void) {
	return sphereCenter;
}

double ModelDetector::getSphereRadius(void) {
	return sphereRadius;
}

bool ModelDetector::fitPupil(const Mat &gray, RotatedRect *pupil) {
	Mat blurred, thresholded;
	GaussianBlur(gray, blurred, Size(5, 5), 0);
	double minVal, maxVal;
	minMaxLoc(blurred, &minVal, &maxVal);
	if(maxVal - minVal < 10.0) {
		return false;
	}
	threshold(blurred, thresholded, minVal + (maxVal - minVal) * 0.25, 255, THRESH_BINARY_INV);

	vector<vector<Point>> contours;
	findContours(thresholded, contours, RETR_EXTERNAL, CHAIN_APPROX_NONE);
	int bestIndex = -1;
	double bestArea = 0.0;
	for(size_t i = 0; i < contours.size(); i++) {
		if(contours[i].size() < 5) {
			continue;
		}
		double area = contourArea(contours[i]);
		if(area > bestArea) {
			bestArea = area;
			bestIndex = (int)i;
		}
	}
	if(bestIndex < 0) {
		return false;
	}
	*pupil = fitEllipse(contours[bestIndex]);
	return true;
}

void ModelDetector::addObservation(RotatedRect pupil) {
	double major = std::max(pupil.size.width, pupil.size.height);
	double minor = std::min(pupil.size.width, pupil.size.height);
	if(major <= 0.0) {
		return;
	}
	PupilObservation observation;
	observation.center = Point2d(pupil.center.x, pupil.center.y);
	observation.axisRatio = minor / major;
	//Nearly circular pupils say nothing about where the sphere is.
	if(observation.axisRatio > 0.95) {
		return;
	}
	double theta = pupil.angle * CV_PI / 180.0;
	if(pupil.size.width <= pupil.size.height) {
		observation.minorAxis = Point2d(std::cos(theta), std::sin(theta));
	} else {
		observation.minorAxis = Point2d(-std::sin(theta), std::cos(theta));
	}
	observations.push_back(observation);
	while(observations.size() > MODELDETECTOR_MAX_OBSERVATIONS) {
		observations.pop_front();
	}
}

void ModelDetector::refitModel(void) {
	if(observations.size() < MODELDETECTOR_MIN_OBSERVATIONS) {
		return;
	}
	Matx22d A(0, 0, 0, 0);
	Matx21d b(0, 0);
	for(auto &observation : observations) {
		Point2d n = observation.minorAxis;
		Matx22d projector(1.0 - n.x * n.x, -n.x * n.y, -n.x * n.y, 1.0 - n.y * n.y);
		A += projector;
		b += projector * Matx21d(observation.center.x, observation.center.y);
	}
	Matx21d solution;
	if(!solve(A, b, solution, DECOMP_SVD)) {
		return;
	}
	Point2d center(solution(0), solution(1));
	if(!std::isfinite(center.x) || !std::isfinite(center.y)) {
		return;
	}

	double radiusSum = 0.0;
	int radiusCount = 0;
	for(auto &observation : observations) {
		double sinTilt = std::sqrt(1.0 - observation.axisRatio * observation.axisRatio);
		if(sinTilt < 0.2) {
			continue;
		}
		radiusSum += Utilities::lineDistance(center, observation.center) / sinTilt;
		radiusCount++;
	}
	if(radiusCount == 0) {
		return;
	}
	sphereCenter = center;
	sphereRadius = radiusSum / (double)radiusCount;
	if(!modelIsReady) {
		logger->debug2("Eye model converged: center <%.02lf, %.02lf>, radius %.02lf", sphereCenter.x, sphereCenter.y, sphereRadius);
	}
	modelIsReady = true;
}

DetectorResult ModelDetector::run(const Mat &gray) {
	DetectorResult result;
	cvtColor(gray, result.diagnosticFrame, COLOR_GRAY2BGR);

	RotatedRect pupil;
	if(!fitPupil(gray, &pupil)) {
		logger->debug3("No pupil ellipse this frame.");
		return result;
	}
	addObservation(pupil);
	refitModel();

	Point2d center(pupil.center.x, pupil.center.y);
	Point2d offset = center - sphereCenter;
	double distance = std::sqrt(offset.x * offset.x + offset.y * offset.y);
	if(modelIsReady && distance > sphereRadius && distance > 0.0) {
		center = sphereCenter + offset * (sphereRadius / distance);
	}

	circle(result.diagnosticFrame, sphereCenter, (int)std::lround(sphereRadius), modelIsReady ? Scalar(255, 255, 0) : Scalar(128, 128, 128), 1);
	ellipse(result.diagnosticFrame, pupil, Scalar(0, 255, 0), 1);
	Utilities::drawX(result.diagnosticFrame, center, Scalar(0, 0, 255), 6);

	result.center = center;
	result.found = true;
	return result;
}

} //namespace EyeTrack
