#include "BlinkClassifier.hpp"

#include <algorithm>
#include <cmath>

using namespace std;
using namespace cv;

namespace EyeTrack {

BlinkClassifier::BlinkClassifier(string myName, double myThreshold, int myWarmupFrames) {
	name = myName;
	threshold = myThreshold;
	if(threshold <= 0.0 || threshold >= 1.0) {
		throw invalid_argument("blink threshold must be between zero and one");
	}
	warmupFrames = myWarmupFrames;
	if(warmupFrames < 0) {
		throw invalid_argument("blink warmupFrames cannot be negative");
	}
	logger = new Logger("BlinkClassifier<" + name + ">");
	reset();
	logger->debug1("BlinkClassifier object constructed and ready to go!");
}

BlinkClassifier::~BlinkClassifier() {
	logger->debug1("BlinkClassifier object destructing...");
	delete logger;
}

void BlinkClassifier::reset(void) {
	framesSeen = 0;
	minimumIntensity = 0.0;
	maximumIntensity = 0.0;
	lastBlink = false;
}

double BlinkClassifier::measureIntensity(const Mat &cleanGray, Point2d center) {
	if(cleanGray.empty()) {
		return -1.0;
	}
	int radius = std::max(2, std::min(cleanGray.cols, cleanGray.rows) / 6);
	Rect window((int)std::lround(center.x) - radius, (int)std::lround(center.y) - radius, radius * 2, radius * 2);
	window &= Rect(0, 0, cleanGray.cols, cleanGray.rows);
	if(window.area() <= 0) {
		return -1.0;
	}
	return mean(cleanGray(window))[0];
}

bool BlinkClassifier::classify(const Mat &cleanGray, Point2d center) {
	double intensity = measureIntensity(cleanGray, center);
	if(intensity < 0.0) {
		return false;
	}
	if(framesSeen == 0) {
		minimumIntensity = intensity;
		maximumIntensity = intensity;
	} else {
		minimumIntensity = std::min(minimumIntensity, intensity);
		maximumIntensity = std::max(maximumIntensity, intensity);
	}
	framesSeen++;

	double range = maximumIntensity - minimumIntensity;
	bool blink = false;
	if(framesSeen > warmupFrames && range >= 1.0) {
		blink = intensity >= minimumIntensity + range * threshold;
	}
	if(blink != lastBlink) {
		logger->debug2("Eye is now %s (intensity %.01lf, range %.01lf to %.01lf).", blink ? "closed" : "open", intensity, minimumIntensity, maximumIntensity);
	}
	lastBlink = blink;
	return blink;
}

double BlinkClassifier::getMinimumIntensity(void) {
	return minimumIntensity;
}

double BlinkClassifier::getMaximumIntensity(void) {
	return maximumIntensity;
}

int BlinkClassifier::getFramesSeen(void) {
	return framesSeen;
}

} //namespace EyeTrack
