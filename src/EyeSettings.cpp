#include "EyeSettings.hpp"

#include <cstdio>

using namespace std;
using namespace cv;

namespace EyeTrack {

string getDetectorAlgorithmName(DetectorAlgorithm algorithm) {
	switch(algorithm) {
		default:
			throw invalid_argument("Unsupported DetectorAlgorithm");
		case DETECTOR_EDGE:
			return "edge";
		case DETECTOR_HYBRID:
			return "hybrid";
		case DETECTOR_MODEL:
			return "model";
		case DETECTOR_BLOB:
			return "blob";
	}
}

DetectorAlgorithm getDetectorAlgorithmFromName(string name) {
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		if(name == getDetectorAlgorithmName((DetectorAlgorithm)i)) {
			return (DetectorAlgorithm)i;
		}
	}
	throw invalid_argument("Unsupported DetectorAlgorithm name");
}

EyeSettings::EyeSettings(void) {
	roiX = 0;
	roiY = 0;
	roiWidth = 0;
	roiHeight = 0;
	rotationAngle = 0.0;
	focalLength = 30.0;
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		algorithms[i].enabled = false;
		algorithms[i].priority = (int)i + 1;
	}
	smoothingMinCutoff = 0.0004;
	smoothingSpeedCoefficient = 0.9;
	skipAutoRadius = false;
	pupilRadius = 14;
	blobThreshold = 65;
	blobMinimumArea = 10.0;
	blobMaximumArea = 25000.0;
	blinkDetection = true;
	calibrationFrames = 300;
}

EyeSettings EyeSettings::fromJSON(json settings) {
	EyeSettings s;
	s.roiX = settings["roi"]["x"];
	s.roiY = settings["roi"]["y"];
	s.roiWidth = settings["roi"]["width"];
	s.roiHeight = settings["roi"]["height"];
	s.rotationAngle = settings["rotationAngle"];
	s.focalLength = settings["focalLength"];
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		string name = getDetectorAlgorithmName((DetectorAlgorithm)i);
		s.algorithms[i].enabled = settings["algorithms"][name]["enabled"];
		s.algorithms[i].priority = settings["algorithms"][name]["priority"];
	}
	s.smoothingMinCutoff = settings["smoothing"]["minCutoff"];
	s.smoothingSpeedCoefficient = settings["smoothing"]["speedCoefficient"];
	s.skipAutoRadius = settings["skipAutoRadius"];
	s.pupilRadius = settings["pupilRadius"];
	s.blobThreshold = settings["blob"]["threshold"];
	s.blobMinimumArea = settings["blob"]["minimumArea"];
	s.blobMaximumArea = settings["blob"]["maximumArea"];
	s.blinkDetection = settings["blinkDetection"];
	s.calibrationFrames = settings["calibrationFrames"];
	s.validate();
	return s;
}

// Rejects values that would make a detector engine refuse to construct.
void EyeSettings::validate(void) const {
	if(focalLength <= 0.0) {
		throw invalid_argument("focalLength must be greater than zero");
	}
	if(pupilRadius < 1) {
		throw invalid_argument("pupilRadius must be at least one pixel");
	}
	if(blobThreshold < 0 || blobThreshold > 255) {
		throw invalid_argument("blob threshold is out of range");
	}
	if(blobMinimumArea < 0.0 || blobMaximumArea <= blobMinimumArea) {
		throw invalid_argument("blob area limits are nonsense");
	}
	if(calibrationFrames < 0) {
		throw invalid_argument("calibrationFrames cannot be negative");
	}
}

// Accepts "x,y,width,height" in source frame pixels.
bool EyeSettings::parseROI(string text, Rect *roi) {
	int x, y, width, height;
	char trailing;
	if(sscanf(text.c_str(), "%d,%d,%d,%d%c", &x, &y, &width, &height, &trailing) != 4) {
		return false;
	}
	if(x < 0 || y < 0 || width <= 0 || height <= 0) {
		return false;
	}
	*roi = Rect(x, y, width, height);
	return true;
}

Rect EyeSettings::getROI(void) const {
	return Rect(roiX, roiY, roiWidth, roiHeight);
}

bool EyeSettings::hasROI(void) const {
	return roiWidth > 0 && roiHeight > 0;
}

SettingsCell::SettingsCell(EyeSettings initialSettings) {
	initialSettings.validate();
	settings = initialSettings;
	logger = new Logger("SettingsCell");
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}
	logger->debug1("SettingsCell object constructed and ready to go!");
}

SettingsCell::~SettingsCell() {
	logger->debug1("SettingsCell object destructing...");
	SDL_DestroyMutex(myMutex);
	delete logger;
}

EyeSettings SettingsCell::snapshot(void) {
	EyeTrack_MutexLock(myMutex);
	EyeSettings copy = settings;
	EyeTrack_MutexUnlock(myMutex);
	return copy;
}

void SettingsCell::store(EyeSettings newSettings) {
	newSettings.validate();
	EyeTrack_MutexLock(myMutex);
	settings = newSettings;
	EyeTrack_MutexUnlock(myMutex);
}

void SettingsCell::setROI(Rect roi) {
	EyeTrack_MutexLock(myMutex);
	settings.roiX = roi.x;
	settings.roiY = roi.y;
	settings.roiWidth = roi.width;
	settings.roiHeight = roi.height;
	EyeTrack_MutexUnlock(myMutex);
	logger->debug2("ROI set to <%d, %d, %d, %d>", roi.x, roi.y, roi.width, roi.height);
}

void SettingsCell::setRotationAngle(double angle) {
	EyeTrack_MutexLock(myMutex);
	settings.rotationAngle = angle;
	EyeTrack_MutexUnlock(myMutex);
}

void SettingsCell::setFocalLength(double focalLength) {
	if(focalLength <= 0.0) {
		throw invalid_argument("focalLength must be greater than zero");
	}
	EyeTrack_MutexLock(myMutex);
	settings.focalLength = focalLength;
	EyeTrack_MutexUnlock(myMutex);
}

void SettingsCell::setAlgorithmEnabled(DetectorAlgorithm algorithm, bool enabled) {
	if(algorithm >= DETECTOR_ALGORITHM_COUNT) {
		throw invalid_argument("Unsupported DetectorAlgorithm");
	}
	EyeTrack_MutexLock(myMutex);
	settings.algorithms[algorithm].enabled = enabled;
	EyeTrack_MutexUnlock(myMutex);
	logger->debug2("Algorithm %s is now %s.", getDetectorAlgorithmName(algorithm).c_str(), enabled ? "enabled" : "disabled");
}

void SettingsCell::setAlgorithmPriority(DetectorAlgorithm algorithm, int priority) {
	if(algorithm >= DETECTOR_ALGORITHM_COUNT) {
		throw invalid_argument("Unsupported DetectorAlgorithm");
	}
	EyeTrack_MutexLock(myMutex);
	settings.algorithms[algorithm].priority = priority;
	EyeTrack_MutexUnlock(myMutex);
}

void SettingsCell::setSmoothing(json minCutoff, json speedCoefficient) {
	EyeTrack_MutexLock(myMutex);
	settings.smoothingMinCutoff = minCutoff;
	settings.smoothingSpeedCoefficient = speedCoefficient;
	EyeTrack_MutexUnlock(myMutex);
}

void SettingsCell::setBlinkDetection(bool enabled) {
	EyeTrack_MutexLock(myMutex);
	settings.blinkDetection = enabled;
	EyeTrack_MutexUnlock(myMutex);
}

} //namespace EyeTrack
