#include "AlgorithmScheduler.hpp"

using namespace std;

namespace EyeTrack {

SlotTable::SlotTable(void) {
	for(int i = 0; i < SCHEDULER_SLOT_COUNT; i++) {
		occupied[i] = false;
		algorithms[i] = DETECTOR_EDGE;
	}
}

bool SlotTable::isOccupied(int slot) const {
	if(slot < 0 || slot >= SCHEDULER_SLOT_COUNT) {
		return false;
	}
	return occupied[slot];
}

bool SlotTable::isEmpty(void) const {
	for(int i = 0; i < SCHEDULER_SLOT_COUNT; i++) {
		if(occupied[i]) {
			return false;
		}
	}
	return true;
}

SchedulerTick::SchedulerTick(void) {
	invoked = false;
	slot = -1;
	algorithm = DETECTOR_EDGE;
	outcome = DETECTOR_OUTCOME_FAILURE;
}

AlgorithmScheduler::AlgorithmScheduler(string myName) {
	name = myName;
	cascadeCounter = 0;
	logger = new Logger("AlgorithmScheduler<" + name + ">");
	logger->debug1("AlgorithmScheduler object constructed and ready to go!");
}

AlgorithmScheduler::~AlgorithmScheduler() {
	logger->debug1("AlgorithmScheduler object destructing...");
	delete logger;
}

// Walks the algorithms in their fixed order, so on a priority collision the
// later algorithm silently takes the slot.
SlotTable AlgorithmScheduler::buildSlotTable(const EyeSettings &settings, Logger *logger) {
	SlotTable table;
	for(unsigned int i = 0; i < DETECTOR_ALGORITHM_COUNT; i++) {
		if(!settings.algorithms[i].enabled) {
			continue;
		}
		int priority = settings.algorithms[i].priority;
		if(priority < DETECTOR_PRIORITY_MIN || priority > DETECTOR_PRIORITY_MAX) {
			if(logger != NULL) {
				logger->warning("Algorithm %s has priority %d, outside of %d to %d. It will not run.", getDetectorAlgorithmName((DetectorAlgorithm)i).c_str(), priority, DETECTOR_PRIORITY_MIN, DETECTOR_PRIORITY_MAX);
			}
			continue;
		}
		int slot = priority - DETECTOR_PRIORITY_MIN;
		if(table.occupied[slot] && logger != NULL) {
			logger->debug2("Algorithm %s replaces %s at priority %d.", getDetectorAlgorithmName((DetectorAlgorithm)i).c_str(), getDetectorAlgorithmName(table.algorithms[slot]).c_str(), priority);
		}
		table.occupied[slot] = true;
		table.algorithms[slot] = (DetectorAlgorithm)i;
	}
	return table;
}

void AlgorithmScheduler::setSlotTable(SlotTable newTable) {
	table = newTable;
}

SlotTable AlgorithmScheduler::getSlotTable(void) {
	return table;
}

// Four checks, all evaluated every tick. Each check either fires its slot or
// advances the cascade counter, so only the first occupied slot fires. The
// counter always ends the tick at zero.
SchedulerTick AlgorithmScheduler::tick(DetectorInvoker invoker) {
	SchedulerTick result;
	for(int slot = 0; slot < SCHEDULER_SLOT_COUNT; slot++) {
		bool fires = (cascadeCounter == slot) && table.isOccupied(slot);
		if(fires) {
			result.invoked = true;
			result.slot = slot;
			result.algorithm = table.algorithms[slot];
			try {
				result.outcome = invoker(result.algorithm);
			} catch(exception &e) {
				cascadeCounter = 0;
				throw;
			}
		}
		if(slot == SCHEDULER_SLOT_COUNT - 1) {
			cascadeCounter = 0;
		} else if(!fires) {
			cascadeCounter++;
		}
	}
	if(!result.invoked) {
		logger->debug3("Idle tick, no algorithm is slotted.");
	}
	lastTick = result;
	return result;
}

int AlgorithmScheduler::getCascadeCounter(void) {
	return cascadeCounter;
}

SchedulerTick AlgorithmScheduler::getLastTick(void) {
	return lastTick;
}

} //namespace EyeTrack
