#pragma once

#include "DetectorEngine.hpp"
#include "EyeSettings.hpp"
#include "Logger.hpp"

#include <functional>
#include <string>

using namespace std;

namespace EyeTrack {

#define SCHEDULER_SLOT_COUNT 4

class SlotTable {
public:
	SlotTable(void);
	bool isOccupied(int slot) const;
	bool isEmpty(void) const;

	bool occupied[SCHEDULER_SLOT_COUNT];
	DetectorAlgorithm algorithms[SCHEDULER_SLOT_COUNT];
};

class SchedulerTick {
public:
	SchedulerTick(void);

	bool invoked;
	int slot; //Zero based. -1 on an idle tick.
	DetectorAlgorithm algorithm;
	DetectorOutcome outcome;
};

typedef function<DetectorOutcome(DetectorAlgorithm algorithm)> DetectorInvoker;

// Static priority selection. Runs the highest priority occupied slot once per
// tick. Outcomes are recorded, not acted upon.
class AlgorithmScheduler {
public:
	AlgorithmScheduler(string myName);
	~AlgorithmScheduler();
	static SlotTable buildSlotTable(const EyeSettings &settings, Logger *logger = NULL);
	void setSlotTable(SlotTable newTable);
	SlotTable getSlotTable(void);
	SchedulerTick tick(DetectorInvoker invoker);
	int getCascadeCounter(void);
	SchedulerTick getLastTick(void);
private:
	string name;
	SlotTable table;
	int cascadeCounter;
	SchedulerTick lastTick;

	Logger *logger;
};

}; //namespace EyeTrack
