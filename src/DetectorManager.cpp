#include "DetectorManager.hpp"
#include "BlobDetector.hpp"
#include "EdgeDetector.hpp"
#include "HybridDetector.hpp"
#include "ModelDetector.hpp"

using namespace std;
using namespace cv;

namespace EyeTrack {

DetectorManager::DetectorManager(string myName, DetectorEngineFactory myFactory) {
	name = myName;
	factory = myFactory;
	if(!factory) {
		factory = createDefaultEngine;
	}
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		engines[i] = NULL;
		constructionCounts[i] = 0;
	}
	resolution = Size(0, 0);
	logger = new Logger("DetectorManager<" + name + ">");
	logger->debug1("DetectorManager object constructed and ready to go!");
}

DetectorManager::~DetectorManager() noexcept(false) {
	logger->debug1("DetectorManager object destructing...");
	destroyAll();
	delete logger;
}

DetectorEngine *DetectorManager::createDefaultEngine(DetectorAlgorithm algorithm, const EngineParameters &parameters) {
	switch(algorithm) {
		default:
			throw invalid_argument("Unsupported DetectorAlgorithm");
		case DETECTOR_EDGE:
			return new EdgeDetector(parameters);
		case DETECTOR_HYBRID:
			return new HybridDetector(parameters);
		case DETECTOR_MODEL:
			return new ModelDetector(parameters);
		case DETECTOR_BLOB:
			return new BlobDetector(parameters);
	}
}

void DetectorManager::reconcile(const EyeSettings &settings, Size newResolution) {
	if(newResolution != resolution) {
		bool hadEngines = false;
		for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
			if(engines[i] != NULL) {
				hadEngines = true;
				destroyEngine((DetectorAlgorithm)i);
			}
		}
		if(hadEngines) {
			logger->info("Working resolution changed from %dx%d to %dx%d. Rebuilding detectors.", resolution.width, resolution.height, newResolution.width, newResolution.height);
		}
		resolution = newResolution;
	}

	EngineParameters parameters = EngineParameters::fromSettings(settings, resolution);
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		DetectorAlgorithm algorithm = (DetectorAlgorithm)i;
		if(!settings.algorithms[i].enabled) {
			if(engines[i] != NULL) {
				destroyEngine(algorithm);
			}
			continue;
		}
		if(engines[i] == NULL) {
			logger->debug1("Constructing %s detector for %dx%d.", getDetectorAlgorithmName(algorithm).c_str(), resolution.width, resolution.height);
			engines[i] = factory(algorithm, parameters);
			if(engines[i] == NULL) {
				throw runtime_error("Detector factory returned NULL");
			}
			constructionCounts[i]++;
		} else {
			engines[i]->updateTuning(parameters);
		}
	}
}

void DetectorManager::destroyEngine(DetectorAlgorithm algorithm) {
	logger->debug1("Destroying %s detector.", getDetectorAlgorithmName(algorithm).c_str());
	EyeTrack_CarefullyDelete_NoStatus(logger, engines[algorithm]);
}

void DetectorManager::destroyAll(void) {
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		if(engines[i] != NULL) {
			destroyEngine((DetectorAlgorithm)i);
		}
	}
}

DetectorEngine *DetectorManager::getEngine(DetectorAlgorithm algorithm) {
	if(algorithm >= DETECTOR_ALGORITHM_COUNT) {
		throw invalid_argument("Unsupported DetectorAlgorithm");
	}
	return engines[algorithm];
}

bool DetectorManager::hasEngine(DetectorAlgorithm algorithm) {
	return getEngine(algorithm) != NULL;
}

Size DetectorManager::getResolution(void) {
	return resolution;
}

int DetectorManager::getConstructionCount(DetectorAlgorithm algorithm) {
	if(algorithm >= DETECTOR_ALGORITHM_COUNT) {
		throw invalid_argument("Unsupported DetectorAlgorithm");
	}
	return constructionCounts[algorithm];
}

} //namespace EyeTrack
