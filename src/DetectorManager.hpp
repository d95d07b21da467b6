#pragma once

#include "DetectorEngine.hpp"
#include "EyeSettings.hpp"
#include "Logger.hpp"

#include "opencv2/core.hpp"

#include <functional>
#include <string>

using namespace std;

namespace EyeTrack {

typedef function<DetectorEngine *(DetectorAlgorithm algorithm, const EngineParameters &parameters)> DetectorEngineFactory;

// Owns one lazily built engine per algorithm. Engines come to life when their
// algorithm is enabled, are torn down the moment it is disabled, and are
// rebuilt from scratch when the working resolution changes.
class DetectorManager {
public:
	DetectorManager(string myName, DetectorEngineFactory myFactory = nullptr);
	~DetectorManager() noexcept(false);
	void reconcile(const EyeSettings &settings, cv::Size resolution);
	void destroyAll(void);
	DetectorEngine *getEngine(DetectorAlgorithm algorithm);
	bool hasEngine(DetectorAlgorithm algorithm);
	cv::Size getResolution(void);
	int getConstructionCount(DetectorAlgorithm algorithm);
	static DetectorEngine *createDefaultEngine(DetectorAlgorithm algorithm, const EngineParameters &parameters);
private:
	void destroyEngine(DetectorAlgorithm algorithm);

	string name;
	DetectorEngineFactory factory;
	DetectorEngine *engines[DETECTOR_ALGORITHM_COUNT];
	int constructionCounts[DETECTOR_ALGORITHM_COUNT];
	cv::Size resolution;

	Logger *logger;
};

}; //namespace EyeTrack
