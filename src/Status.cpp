#include "Status.hpp"
#include "Utilities.hpp"

using namespace std;

namespace EyeTrack {

Status::Status(void) {
	isRunning = false;
	emergency = false;
	cancelled = false;
	if((myMutex = SDL_CreateMutex()) == NULL) {
		throw runtime_error("Failed creating mutex!");
	}
	if((myCond = SDL_CreateCond()) == NULL) {
		throw runtime_error("Failed creating condition!");
	}
	logger = new Logger("Status");
	setIsRunning(true);
	logger->debug1("Status object constructed and ready to go!");
}

Status::~Status() noexcept(false) {
	logger->debug1("Status object destructing...");
	SDL_DestroyCond(myCond);
	SDL_DestroyMutex(myMutex);
	delete logger;
}

void Status::setIsRunning(bool newIsRunning) {
	EyeTrack_MutexLock(myMutex);
	if(newIsRunning != isRunning) {
		logger->info("Running is set to %s...", newIsRunning ? "TRUE" : "FALSE");
	}
	isRunning = newIsRunning;
	EyeTrack_MutexUnlock(myMutex);
}

bool Status::getIsRunning(void) {
	EyeTrack_MutexLock(myMutex);
	bool status = isRunning;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

void Status::setEmergency(void) {
	EyeTrack_MutexLock(myMutex);
	if(!emergency) {
		logger->emerg("Initiated Emergency Stop");
	}
	emergency = true;
	EyeTrack_MutexUnlock(myMutex);
	requestCancellation();
	setIsRunning(false);
}

bool Status::getEmergency(void) {
	EyeTrack_MutexLock(myMutex);
	bool status = emergency;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

void Status::requestCancellation(void) {
	EyeTrack_MutexLock(myMutex);
	if(!cancelled) {
		logger->info("Cancellation requested.");
	}
	cancelled = true;
	SDL_CondBroadcast(myCond);
	EyeTrack_MutexUnlock(myMutex);
}

bool Status::getIsCancelled(void) {
	EyeTrack_MutexLock(myMutex);
	bool status = cancelled;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

// Sleeps until cancellation is requested or the timeout elapses, whichever
// comes first. Returns true if cancellation was requested.
bool Status::waitForCancellation(Uint32 timeoutMilliseconds) {
	EyeTrack_MutexLock(myMutex);
	if(!cancelled) {
		int result = SDL_CondWaitTimeout(myCond, myMutex, timeoutMilliseconds);
		if(result < 0) {
			EyeTrack_MutexUnlock(myMutex);
			throw runtime_error("CondWaitTimeout() failed!");
		}
	}
	bool status = cancelled;
	EyeTrack_MutexUnlock(myMutex);
	return status;
}

} //namespace EyeTrack
