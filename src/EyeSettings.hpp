#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "SDL.h"
#include "opencv2/core.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

// Fixed assignment order of the slot table. When two enabled algorithms claim
// the same priority, the later one in this order wins.
enum DetectorAlgorithm: unsigned int {
	DETECTOR_EDGE = 0,
	DETECTOR_HYBRID = 1,
	DETECTOR_MODEL = 2,
	DETECTOR_BLOB = 3
};
#define DETECTOR_ALGORITHM_COUNT 4
#define DETECTOR_PRIORITY_MIN 1
#define DETECTOR_PRIORITY_MAX 4

string getDetectorAlgorithmName(DetectorAlgorithm algorithm);
DetectorAlgorithm getDetectorAlgorithmFromName(string name);

class AlgorithmSetting {
public:
	bool enabled;
	int priority;
};

class EyeSettings {
public:
	EyeSettings(void);
	static EyeSettings fromJSON(json settings);
	static bool parseROI(string text, cv::Rect *roi);
	void validate(void) const;
	cv::Rect getROI(void) const;
	bool hasROI(void) const;

	int roiX, roiY, roiWidth, roiHeight;
	double rotationAngle;
	double focalLength;
	AlgorithmSetting algorithms[DETECTOR_ALGORITHM_COUNT];

	// Kept as they were entered so the consumer can detect garbage and fall
	// back to safe defaults.
	json smoothingMinCutoff;
	json smoothingSpeedCoefficient;

	bool skipAutoRadius;
	int pupilRadius;
	int blobThreshold;
	double blobMinimumArea, blobMaximumArea;
	bool blinkDetection;
	int calibrationFrames;
};

// Holds the live settings for one eye. Writers (the UI side) replace single
// fields; the processing worker takes one copy per tick. Fields written
// between two snapshots are not guaranteed to arrive together.
class SettingsCell {
public:
	SettingsCell(EyeSettings initialSettings);
	~SettingsCell();
	EyeSettings snapshot(void);
	void store(EyeSettings newSettings);
	void setROI(cv::Rect roi);
	void setRotationAngle(double angle);
	void setFocalLength(double focalLength);
	void setAlgorithmEnabled(DetectorAlgorithm algorithm, bool enabled);
	void setAlgorithmPriority(DetectorAlgorithm algorithm, int priority);
	void setSmoothing(json minCutoff, json speedCoefficient);
	void setBlinkDetection(bool enabled);
private:
	EyeSettings settings;

	Logger *logger;
	SDL_mutex *myMutex;
};

}; //namespace EyeTrack
