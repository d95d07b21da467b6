#pragma once

#include "EyeSettings.hpp"
#include "Utilities.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

enum GazeOrigin: unsigned int {
	GAZE_ORIGIN_EDGE,
	GAZE_ORIGIN_BLOB,
	GAZE_ORIGIN_MODEL,
	GAZE_ORIGIN_HYBRID,
	GAZE_ORIGIN_FAILURE
};

// One tick's result for one eye. When blink is true the coordinates carry no
// gaze information.
class GazeRecord {
public:
	GazeRecord(void);
	GazeRecord(GazeOrigin myOrigin, double myX, double myY, bool myBlink);
	bool isGazeSample(void) const;
	json toJSON(void) const;
	static string getOriginName(GazeOrigin origin);
	static GazeOrigin originForAlgorithm(DetectorAlgorithm algorithm);

	GazeOrigin origin;
	double x, y;
	int dilation;
	bool blink;
};

}; //namespace EyeTrack
