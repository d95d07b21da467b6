#pragma once

#include "DetectorEngine.hpp"
#include "Logger.hpp"

#include "opencv2/core.hpp"

#include <deque>

using namespace std;

namespace EyeTrack {

#define MODELDETECTOR_MAX_OBSERVATIONS 200
#define MODELDETECTOR_MIN_OBSERVATIONS 10
#define MODELDETECTOR_REFERENCE_FOCAL_LENGTH 30.0

class PupilObservation {
public:
	cv::Point2d center;
	cv::Point2d minorAxis; //Unit vector. Points toward the projected eye center.
	double axisRatio; //Minor over major.
};

// Dark-pupil ellipse fit feeding a projected eye-sphere model. Each
// sufficiently elliptic pupil contributes a line along its minor axis; the
// least-squares intersection of those lines is the projected sphere center.
class ModelDetector: public DetectorEngine {
public:
	ModelDetector(EngineParameters myParameters);
	~ModelDetector();
	DetectorAlgorithm getAlgorithm(void);
	DetectorResult run(const cv::Mat &gray);
	void updateTuning(const EngineParameters &myParameters);
	bool getModelIsReady(void);
	cv::Point2d getSphereCenter(void);
	double getSphereRadius(void);
	void resetModel(void);
private:
	bool fitPupil(const cv::Mat &gray, cv::RotatedRect *pupil);
	void addObservation(cv::RotatedRect pupil);
	void refitModel(void);

	EngineParameters parameters;
	deque<PupilObservation> observations;
	bool modelIsReady;
	cv::Point2d sphereCenter;
	double sphereRadius;

	Logger *logger;
};

}; //namespace EyeTrack
