#include "Metrics.hpp"

#include "opencv2/core/utility.hpp"

#include <cstdio>

using namespace std;
using namespace cv;

namespace EyeTrack {

MetricsSummary::MetricsSummary(void) {
	samples = 0;
	averageSeconds = 0.0;
	worstSeconds = 0.0;
	rate = 0.0;
}

Metrics::Metrics(json config, string myName, bool myMetricIsFrames) {
	name = myName;
	metricIsFrames = myMetricIsFrames;
	averageOverSeconds = config["EyeTrack"]["Metrics"]["averageOverSeconds"];
	if(averageOverSeconds <= 0.0) {
		throw invalid_argument("averageOverSeconds must be greater than zero");
	}
	reportEverySeconds = config["EyeTrack"]["Metrics"]["reportEverySeconds"];
	if(reportEverySeconds < 1.0) {
		throw invalid_argument("reportEverySeconds cannot be less than one");
	}
	lastReport = now();
	logger = new Logger("Metrics<" + name + ">");
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}
	logger->debug1("Metrics object constructed and ready to go!");
}

Metrics::~Metrics() {
	logger->debug1("Metrics object destructing...");
	logger->debug1("Final: %s", describeLocked(now()).c_str());
	SDL_DestroyMutex(myMutex);
	delete logger;
}

double Metrics::now(void) {
	return (double)getTickCount() / getTickFrequency();
}

MetricsTick Metrics::startClock(void) {
	MetricsTick tick;
	tick.startTime = now();
	return tick;
}

void Metrics::endClock(MetricsTick tick) {
	double endTime = now();
	Sample sample;
	sample.startTime = tick.startTime;
	sample.runTime = endTime - tick.startTime;

	EyeTrack_MutexLock(myMutex);
	window.push_back(sample);
	while(window.size() > 1 && window.front().startTime < sample.startTime - averageOverSeconds) {
		window.pop_front();
	}
	bool report = endTime - lastReport >= reportEverySeconds;
	if(report) {
		lastReport = endTime;
	}
	string description = report ? describeLocked(endTime) : "";
	EyeTrack_MutexUnlock(myMutex);

	if(report) {
		logger->debug1("%s", description.c_str());
	}
}

MetricsSummary Metrics::summarizeLocked(double endTime) {
	MetricsSummary summary;
	summary.samples = window.size();
	if(summary.samples == 0) {
		return summary;
	}
	double total = 0.0;
	for(const Sample &sample : window) {
		total += sample.runTime;
		if(sample.runTime > summary.worstSeconds) {
			summary.worstSeconds = sample.runTime;
		}
	}
	summary.averageSeconds = total / (double)summary.samples;
	double span = endTime - window.front().startTime;
	if(summary.samples > 1 && span > 0.0) {
		summary.rate = (double)summary.samples / span;
	}
	return summary;
}

string Metrics::describeLocked(double endTime) {
	MetricsSummary summary = summarizeLocked(endTime);
	if(summary.samples == 0) {
		return name + ": no samples";
	}
	char buffer[192];
	snprintf(buffer, sizeof(buffer), ": %lu samples, avg %.02fms, worst %.02fms, %.02f %s/sec", (unsigned long)summary.samples, summary.averageSeconds * 1000.0, summary.worstSeconds * 1000.0, summary.rate, metricIsFrames ? "frames" : "runs");
	return name + buffer;
}

MetricsSummary Metrics::getSummary(void) {
	double endTime = now();
	EyeTrack_MutexLock(myMutex);
	MetricsSummary summary = summarizeLocked(endTime);
	EyeTrack_MutexUnlock(myMutex);
	return summary;
}

string Metrics::describe(void) {
	double endTime = now();
	EyeTrack_MutexLock(myMutex);
	string description = describeLocked(endTime);
	EyeTrack_MutexUnlock(myMutex);
	return description;
}

} //namespace EyeTrack
