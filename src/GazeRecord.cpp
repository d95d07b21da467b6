#include "GazeRecord.hpp"

using namespace std;

namespace EyeTrack {

GazeRecord::GazeRecord(void) {
	origin = GAZE_ORIGIN_FAILURE;
	x = 0.0;
	y = 0.0;
	dilation = 0;
	blink = false;
}

GazeRecord::GazeRecord(GazeOrigin myOrigin, double myX, double myY, bool myBlink) {
	origin = myOrigin;
	x = myX;
	y = myY;
	dilation = 0;
	blink = myBlink;
}

bool GazeRecord::isGazeSample(void) const {
	return origin != GAZE_ORIGIN_FAILURE && !blink;
}

json GazeRecord::toJSON(void) const {
	json record;
	record["origin"] = getOriginName(origin);
	record["blink"] = blink;
	record["dilation"] = dilation;
	if(blink) {
		record["x"] = nullptr;
		record["y"] = nullptr;
	} else {
		record["x"] = x;
		record["y"] = y;
	}
	return record;
}

string GazeRecord::getOriginName(GazeOrigin origin) {
	switch(origin) {
		default:
			throw invalid_argument("Unsupported GazeOrigin");
		case GAZE_ORIGIN_EDGE:
			return "edge";
		case GAZE_ORIGIN_BLOB:
			return "blob";
		case GAZE_ORIGIN_MODEL:
			return "model";
		case GAZE_ORIGIN_HYBRID:
			return "hybrid";
		case GAZE_ORIGIN_FAILURE:
			return "failure";
	}
}

GazeOrigin GazeRecord::originForAlgorithm(DetectorAlgorithm algorithm) {
	switch(algorithm) {
		default:
			throw invalid_argument("Unsupported DetectorAlgorithm");
		case DETECTOR_EDGE:
			return GAZE_ORIGIN_EDGE;
		case DETECTOR_HYBRID:
			return GAZE_ORIGIN_HYBRID;
		case DETECTOR_MODEL:
			return GAZE_ORIGIN_MODEL;
		case DETECTOR_BLOB:
			return GAZE_ORIGIN_BLOB;
	}
}

} //namespace EyeTrack
