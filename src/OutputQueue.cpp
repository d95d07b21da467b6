#include "OutputQueue.hpp"

#include <utility>

using namespace std;
using namespace cv;

namespace EyeTrack {

OutputQueue::OutputQueue(json config, string myName) {
	name = myName;
	int myCapacity = config["EyeTrack"]["OutputQueue"]["capacity"];
	if(myCapacity < 1) {
		throw invalid_argument("OutputQueue capacity must be at least one");
	}
	capacity = (size_t)myCapacity;
	droppedCount = 0;
	logger = new Logger("OutputQueue<" + name + ">");
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}
	if((myCond = SDL_CreateCond()) == NULL) {
		throw runtime_error("Failed creating condition!");
	}
	logger->debug1("OutputQueue object constructed with capacity %lu.", (unsigned long)capacity);
}

OutputQueue::~OutputQueue() {
	logger->debug1("OutputQueue object destructing...");
	if(droppedCount > 0) {
		logger->notice("Dropped %lu outputs over our lifetime because nobody consumed them.", (unsigned long)droppedCount);
	}
	SDL_DestroyCond(myCond);
	SDL_DestroyMutex(myMutex);
	delete logger;
}

void OutputQueue::push(EyeOutput output) {
	EyeTrack_MutexLock(myMutex);
	while(outputs.size() >= capacity) {
		logger->warning("Output queue is full! Dropping output for frame " EYETRACK_FRAMENUMBER_FORMAT ".", outputs.front().frameNumber);
		outputs.pop_front();
		droppedCount++;
	}
	outputs.push_back(std::move(output));
	SDL_CondSignal(myCond);
	EyeTrack_MutexUnlock(myMutex);
}

bool OutputQueue::pop(EyeOutput *output, Uint32 timeoutMilliseconds) {
	if(output == NULL) {
		throw invalid_argument("output cannot be NULL");
	}
	EyeTrack_MutexLock(myMutex);
	if(outputs.size() == 0) {
		int result = SDL_CondWaitTimeout(myCond, myMutex, timeoutMilliseconds);
		if(result < 0) {
			EyeTrack_MutexUnlock(myMutex);
			throw runtime_error("CondWaitTimeout() failed!");
		}
		if(outputs.size() == 0) {
			EyeTrack_MutexUnlock(myMutex);
			return false;
		}
	}
	*output = std::move(outputs.front());
	outputs.pop_front();
	EyeTrack_MutexUnlock(myMutex);
	return true;
}

size_t OutputQueue::getSize(void) {
	EyeTrack_MutexLock(myMutex);
	size_t status = outputs.size();
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

size_t OutputQueue::getDroppedCount(void) {
	EyeTrack_MutexLock(myMutex);
	size_t status = droppedCount;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

} //namespace EyeTrack
