#include "DetectorEngine.hpp"

using namespace std;
using namespace cv;

namespace EyeTrack {

DetectorResult::DetectorResult(void) {
	found = false;
	center = Point2d(0.0, 0.0);
}

// (0, 0) has always meant "no pupil" to downstream consumers, so it is never
// a valid sample even when an engine claims success.
bool DetectorResult::isValidSample(void) const {
	if(!found) {
		return false;
	}
	return !(center.x == 0.0 && center.y == 0.0);
}

EngineParameters::EngineParameters(void) {
	resolution = Size(0, 0);
	focalLength = 30.0;
	skipAutoRadius = false;
	pupilRadius = 14;
	blobThreshold = 65;
	blobMinimumArea = 10.0;
	blobMaximumArea = 25000.0;
}

EngineParameters EngineParameters::fromSettings(const EyeSettings &settings, Size resolution) {
	EngineParameters parameters;
	parameters.resolution = resolution;
	parameters.focalLength = settings.focalLength;
	parameters.skipAutoRadius = settings.skipAutoRadius;
	parameters.pupilRadius = settings.pupilRadius;
	parameters.blobThreshold = settings.blobThreshold;
	parameters.blobMinimumArea = settings.blobMinimumArea;
	parameters.blobMaximumArea = settings.blobMaximumArea;
	return parameters;
}

} //namespace EyeTrack
