#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "opencv2/core.hpp"

#include <string>

using namespace std;

namespace EyeTrack {

// Maps raw pupil coordinates into [-1, 1] on each axis using the extent
// observed so far. Bounds only ever widen; restartCalibration() is the only
// way to forget them.
class GazeCalibrator {
public:
	GazeCalibrator(string myName);
	~GazeCalibrator();
	cv::Point2d normalize(cv::Point2d raw);
	void restartCalibration(int frames);
	void recenter(void);
	bool getIsCalibrating(void);
	bool getHasCenter(void);
	cv::Point2d getCenter(void);
	cv::Rect2d getBounds(void);
	bool getHasBounds(void);
private:
	static double normalizeAxis(double value, double minimum, double maximum, double center, bool haveCenter);

	string name;
	bool haveBounds;
	double xMin, xMax, yMin, yMax;
	bool haveCenter;
	cv::Point2d center;
	bool recenterRequested;
	int calibrationFramesRemaining;

	Logger *logger;
};

}; //namespace EyeTrack
