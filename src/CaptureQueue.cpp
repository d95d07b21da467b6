#include "CaptureQueue.hpp"

#include <utility>

using namespace std;
using namespace cv;

namespace EyeTrack {

CaptureQueue::CaptureQueue(json config, string myName) {
	name = myName;
	int myCapacity = config["EyeTrack"]["CaptureQueue"]["capacity"];
	if(myCapacity < 1) {
		throw invalid_argument("CaptureQueue capacity must be at least one");
	}
	capacity = (size_t)myCapacity;
	captureRequested = false;
	logger = new Logger("CaptureQueue<" + name + ">");
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}
	if((notEmptyCond = SDL_CreateCond()) == NULL) {
		throw runtime_error("Failed creating condition!");
	}
	if((notFullCond = SDL_CreateCond()) == NULL) {
		throw runtime_error("Failed creating condition!");
	}
	if((captureRequestedCond = SDL_CreateCond()) == NULL) {
		throw runtime_error("Failed creating condition!");
	}
	logger->debug1("CaptureQueue object constructed with capacity %lu.", (unsigned long)capacity);
}

CaptureQueue::~CaptureQueue() {
	logger->debug1("CaptureQueue object destructing...");
	SDL_DestroyCond(captureRequestedCond);
	SDL_DestroyCond(notFullCond);
	SDL_DestroyCond(notEmptyCond);
	SDL_DestroyMutex(myMutex);
	delete logger;
}

bool CaptureQueue::push(CapturedFrame capturedFrame, Uint32 timeoutMilliseconds) {
	EyeTrack_MutexLock(myMutex);
	if(frames.size() >= capacity) {
		int result = SDL_CondWaitTimeout(notFullCond, myMutex, timeoutMilliseconds);
		if(result < 0) {
			EyeTrack_MutexUnlock(myMutex);
			throw runtime_error("CondWaitTimeout() failed!");
		}
		if(frames.size() >= capacity) {
			EyeTrack_MutexUnlock(myMutex);
			logger->debug3("Queue still full after %u ms, frame " EYETRACK_FRAMENUMBER_FORMAT " not delivered.", timeoutMilliseconds, capturedFrame.frameNumber);
			return false;
		}
	}
	frames.push_back(std::move(capturedFrame));
	SDL_CondSignal(notEmptyCond);
	EyeTrack_MutexUnlock(myMutex);
	return true;
}

bool CaptureQueue::pop(CapturedFrame *capturedFrame, Uint32 timeoutMilliseconds) {
	if(capturedFrame == NULL) {
		throw invalid_argument("capturedFrame cannot be NULL");
	}
	EyeTrack_MutexLock(myMutex);
	if(frames.size() == 0) {
		int result = SDL_CondWaitTimeout(notEmptyCond, myMutex, timeoutMilliseconds);
		if(result < 0) {
			EyeTrack_MutexUnlock(myMutex);
			throw runtime_error("CondWaitTimeout() failed!");
		}
		if(frames.size() == 0) {
			EyeTrack_MutexUnlock(myMutex);
			return false;
		}
	}
	*capturedFrame = std::move(frames.front());
	frames.pop_front();
	SDL_CondSignal(notFullCond);
	EyeTrack_MutexUnlock(myMutex);
	return true;
}

bool CaptureQueue::isEmpty(void) {
	EyeTrack_MutexLock(myMutex);
	bool status = frames.size() == 0;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

size_t CaptureQueue::getSize(void) {
	EyeTrack_MutexLock(myMutex);
	size_t status = frames.size();
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

size_t CaptureQueue::getCapacity(void) {
	return capacity;
}

void CaptureQueue::setCaptureRequested(void) {
	EyeTrack_MutexLock(myMutex);
	captureRequested = true;
	SDL_CondBroadcast(captureRequestedCond);
	EyeTrack_MutexUnlock(myMutex);
}

// Returns true (and clears the flag) if the consumer asked for a frame before
// the timeout ran out.
bool CaptureQueue::waitForCaptureRequest(Uint32 timeoutMilliseconds) {
	EyeTrack_MutexLock(myMutex);
	if(!captureRequested) {
		int result = SDL_CondWaitTimeout(captureRequestedCond, myMutex, timeoutMilliseconds);
		if(result < 0) {
			EyeTrack_MutexUnlock(myMutex);
			throw runtime_error("CondWaitTimeout() failed!");
		}
	}
	bool status = captureRequested;
	captureRequested = false;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

} //namespace EyeTrack
