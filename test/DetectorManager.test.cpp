#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "AlgorithmScheduler.hpp"
#include "DetectorManager.hpp"
#include "TestSupport.hpp"

using namespace cv;
using namespace EyeTrack;
using namespace EyeTrack::Testing;

namespace {

EyeSettings settingsEnabling(std::initializer_list<DetectorAlgorithm> enabled) {
	EyeSettings settings;
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		settings.algorithms[i].enabled = false;
		settings.algorithms[i].priority = (int)i + 1;
	}
	for(DetectorAlgorithm algorithm : enabled) {
		settings.algorithms[algorithm].enabled = true;
	}
	return settings;
}

TEST(DetectorManager, BuildsNothingUntilAnAlgorithmIsEnabled) {
	DetectorManager manager("test");
	manager.reconcile(settingsEnabling({}), Size(100, 100));
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		ASSERT_FALSE(manager.hasEngine((DetectorAlgorithm)i));
		ASSERT_EQ(manager.getConstructionCount((DetectorAlgorithm)i), 0);
	}
}

TEST(DetectorManager, BuildsTheDefaultEngineForEachAlgorithm) {
	DetectorManager manager("test");
	manager.reconcile(settingsEnabling({DETECTOR_EDGE, DETECTOR_HYBRID, DETECTOR_MODEL, DETECTOR_BLOB}), Size(120, 80));
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		DetectorEngine *engine = manager.getEngine((DetectorAlgorithm)i);
		ASSERT_NE(engine, nullptr);
		ASSERT_EQ(engine->getAlgorithm(), (DetectorAlgorithm)i);
	}
	ASSERT_EQ(manager.getResolution(), Size(120, 80));
}

TEST(DetectorManager, DisablingAnAlgorithmDropsOnlyItsEngineAndSlot) {
	DetectorManager manager("test");
	EyeSettings settings = settingsEnabling({DETECTOR_EDGE, DETECTOR_BLOB});
	manager.reconcile(settings, Size(100, 100));
	DetectorEngine *blob = manager.getEngine(DETECTOR_BLOB);
	ASSERT_TRUE(manager.hasEngine(DETECTOR_EDGE));
	ASSERT_NE(blob, nullptr);

	settings.algorithms[DETECTOR_EDGE].enabled = false;
	manager.reconcile(settings, Size(100, 100));
	ASSERT_FALSE(manager.hasEngine(DETECTOR_EDGE));
	ASSERT_EQ(manager.getEngine(DETECTOR_BLOB), blob);
	ASSERT_EQ(manager.getConstructionCount(DETECTOR_BLOB), 1);

	SlotTable table = AlgorithmScheduler::buildSlotTable(settings);
	ASSERT_FALSE(table.occupied[DETECTOR_EDGE]);
	ASSERT_TRUE(table.occupied[3]);
	ASSERT_EQ(table.algorithms[3], DETECTOR_BLOB);
}

TEST(DetectorManager, ReenablingBuildsAFreshEngine) {
	DetectorManager manager("test");
	EyeSettings settings = settingsEnabling({DETECTOR_EDGE});
	manager.reconcile(settings, Size(100, 100));
	settings.algorithms[DETECTOR_EDGE].enabled = false;
	manager.reconcile(settings, Size(100, 100));
	settings.algorithms[DETECTOR_EDGE].enabled = true;
	manager.reconcile(settings, Size(100, 100));
	ASSERT_TRUE(manager.hasEngine(DETECTOR_EDGE));
	ASSERT_EQ(manager.getConstructionCount(DETECTOR_EDGE), 2);
}

TEST(DetectorManager, ResolutionChangeRebuildsEveryLiveEngine) {
	int constructed = 0;
	DetectorManager manager("test", [&](DetectorAlgorithm algorithm, const EngineParameters &parameters) {
		constructed++;
		EXPECT_EQ(parameters.resolution, constructed <= 2 ? Size(100, 100) : Size(64, 48));
		return DetectorManager::createDefaultEngine(algorithm, parameters);
	});
	EyeSettings settings = settingsEnabling({DETECTOR_HYBRID, DETECTOR_MODEL});
	manager.reconcile(settings, Size(100, 100));
	manager.reconcile(settings, Size(100, 100));
	ASSERT_EQ(constructed, 2);

	manager.reconcile(settings, Size(64, 48));
	ASSERT_EQ(constructed, 4);
	ASSERT_EQ(manager.getConstructionCount(DETECTOR_HYBRID), 2);
	ASSERT_EQ(manager.getConstructionCount(DETECTOR_MODEL), 2);
	ASSERT_EQ(manager.getResolution(), Size(64, 48));
}

TEST(DetectorManager, LiveEnginesReceiveTuningUpdates) {
	MockDetectorEngine *mock = new MockDetectorEngine();
	DetectorManager manager("test", [&](DetectorAlgorithm algorithm, const EngineParameters &parameters) {
		return (DetectorEngine *)mock;
	});
	EyeSettings settings = settingsEnabling({DETECTOR_BLOB});
	manager.reconcile(settings, Size(100, 100));
	settings.blobThreshold = 90;
	EXPECT_CALL(*mock, updateTuning(testing::Field(&EngineParameters::blobThreshold, 90))).Times(1);
	manager.reconcile(settings, Size(100, 100));
}

} //namespace
