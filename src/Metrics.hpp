#pragma once

#include "Logger.hpp"
#include "Utilities.hpp"

#include "SDL.h"

#include <deque>
#include <string>

using namespace std;

namespace EyeTrack {

class MetricsTick {
public:
	double startTime;
};

class MetricsSummary {
public:
	MetricsSummary(void);
	size_t samples;
	double averageSeconds;
	double worstSeconds;
	double rate; //Samples per second across the window. Zero until two samples exist.
};

// Rolling timing over the last averageOverSeconds of samples. Reports itself
// at debug1 every reportEverySeconds and once more on destruction.
class Metrics {
public:
	Metrics(json config, string myName, bool myMetricIsFrames = false);
	~Metrics();
	MetricsTick startClock(void);
	void endClock(MetricsTick tick);
	MetricsSummary getSummary(void);
	string describe(void);
private:
	class Sample {
	public:
		double startTime;
		double runTime;
	};
	static double now(void);
	MetricsSummary summarizeLocked(double endTime);
	string describeLocked(double endTime);

	string name;
	bool metricIsFrames;
	double averageOverSeconds, reportEverySeconds;
	double lastReport;
	deque<Sample> window;

	Logger *logger;
	SDL_mutex *myMutex;
};

}; //namespace EyeTrack
